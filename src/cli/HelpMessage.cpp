/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "HelpMessage.hpp"


namespace ebpfoci {
namespace cli {

HelpMessage& HelpMessage::setUsage(const std::string& usage) {
    this->usage = usage;
    return *this;
}

HelpMessage& HelpMessage::setDescription(const std::string& description) {
    this->description = description;
    return *this;
}

HelpMessage& HelpMessage::setOptionsDescription(const boost::program_options::options_description& optionsDescription) {
    this->optionsDescription = std::make_shared<const boost::program_options::options_description>(optionsDescription);
    return *this;
}

HelpMessage& HelpMessage::addExample(const std::string& example) {
    examples.push_back(example);
    return *this;
}

std::ostream& operator<<(std::ostream& os, const HelpMessage& printer) {
    os  << "Usage: " << printer.usage << "\n"
        << "\n"
        << printer.description << "\n";

    if(printer.optionsDescription && !printer.optionsDescription->options().empty()) {
        os << "\n" << *printer.optionsDescription;
    }

    if(!printer.examples.empty()) {
        os << "\nExamples:\n";
        for(const auto& example : printer.examples) {
            os << "  " << example << "\n";
        }
    }
    return os;
}

}
}
