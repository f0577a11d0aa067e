/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libebpfoci_utility_logging_hpp
#define libebpfoci_utility_logging_hpp

#include <string>

#include <boost/format.hpp>

#include "libebpfoci/Logger.hpp"

/**
 * Logging for code without a subsystem of its own (utilities, configuration,
 * packaging helpers): messages are tagged with the "libebpfoci" subsystem.
 */

namespace libebpfoci {

void logMessage(const std::string&, LogLevel, std::ostream& out = std::cout, std::ostream& err = std::cerr);
void logMessage(const boost::format&, LogLevel, std::ostream& out = std::cout, std::ostream& err = std::cerr);

}

#endif
