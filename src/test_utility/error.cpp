/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "error.hpp"

namespace test_utility {
namespace error {

bool traceContains(const libebpfoci::Error& error, const std::string& text) {
    for(const auto& entry : error.getErrorTrace()) {
        if(entry.errorMessage.find(text) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}
}
