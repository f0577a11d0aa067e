/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_test_utility_error_hpp
#define ebpfoci_test_utility_error_hpp

#include <string>

#include "libebpfoci/Error.hpp"

namespace test_utility {
namespace error {

// true if any entry of the error trace contains the given text
bool traceContains(const libebpfoci::Error& error, const std::string& text);

}
}

#endif
