/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_cli_HelpMessage_hpp
#define ebpfoci_cli_HelpMessage_hpp

#include <ostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/program_options.hpp>


namespace ebpfoci {
namespace cli {

/**
 * Builder of the text printed by "ebpfoci help COMMAND":
 *
 *   Usage: <usage>
 *
 *   <description>
 *
 *   <options, if any>
 *
 *   Examples:
 *     <one line per example, if any>
 */
class HelpMessage {
    friend std::ostream& operator<<(std::ostream&, const HelpMessage&);

public:
    HelpMessage& setUsage(const std::string&);
    HelpMessage& setDescription(const std::string&);
    HelpMessage& setOptionsDescription(const boost::program_options::options_description&);
    HelpMessage& addExample(const std::string&);

private:
    std::string usage;
    std::string description;
    // options_description is neither copyable nor assignable
    std::shared_ptr<const boost::program_options::options_description> optionsDescription;
    std::vector<std::string> examples;
};

std::ostream& operator<<(std::ostream&, const HelpMessage&);

}
}

#endif
