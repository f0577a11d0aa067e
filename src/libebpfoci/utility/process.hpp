/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libebpfoci_utility_process_hpp
#define libebpfoci_utility_process_hpp

#include <chrono>
#include <iostream>
#include <string>

#include "libebpfoci/CLIArguments.hpp"
#include "libebpfoci/Context.hpp"

/**
 * Utility functions for process operations
 */

namespace libebpfoci {
namespace process {

int forkExecWait(const libebpfoci::CLIArguments& args,
                 const libebpfoci::Context& context,
                 std::iostream* const childOutputStream = nullptr,
                 const std::chrono::milliseconds& terminationGracePeriod = std::chrono::milliseconds{2000});
std::string getHostname();

}}

#endif
