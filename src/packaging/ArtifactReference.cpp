/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ArtifactReference.hpp"

#include <sstream>

#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libebpfoci/Error.hpp"
#include "libebpfoci/utility/logging.hpp"
#include "packaging/regex.hpp"


namespace ebpfoci {
namespace packaging {

const std::string ArtifactReference::DEFAULT_TAG{"latest"};

/**
 * The first path component is only taken as a registry when it looks like a
 * host: it contains a dot or a port, is an IPv6 address or is "localhost".
 * This keeps "namespace/name" from being silently pushed to a host called
 * "namespace".
 */
static bool looksLikeRegistryHost(const std::string& domain) {
    return domain.find('.') != std::string::npos
        || domain.find(':') != std::string::npos
        || domain.find('[') == 0
        || domain == "localhost";
}

ArtifactReference ArtifactReference::parse(const std::string& input) {
    libebpfoci::logMessage(boost::format("Parsing artifact reference from string: %s") % input,
                           libebpfoci::LogLevel::DEBUG);

    if(input.find("..") != std::string::npos) {
        auto message = boost::format("Invalid artifact reference '%s'\n"
                                     "Artifact references are not allowed to contain the sequence '..'") % input;
        EBPFOCI_THROW_ERROR(message.str());
    }

    boost::smatch matches;
    if(!boost::regex_match(input, matches, regex::reference)
       || !looksLikeRegistryHost(matches[1].str())) {
        auto message = boost::format("Invalid artifact reference '%s'\n"
                                     "Expected <registry>[:<port>]/<repository>[:<tag>][@<digest>]") % input;
        EBPFOCI_THROW_ERROR(message.str());
    }

    auto reference = ArtifactReference{};
    reference.registry = matches[1].str();
    reference.repository = matches[2].str();
    if(matches[3].matched) {
        reference.tag = matches[3].str();
    }
    else if(!matches[4].matched) {
        reference.tag = DEFAULT_TAG;
    }
    if(matches[4].matched) {
        reference.digest = matches[4].str();
    }

    libebpfoci::logMessage(boost::format("Successfully parsed artifact reference %s") % reference,
                           libebpfoci::LogLevel::DEBUG);
    return reference;
}

std::string ArtifactReference::getFullName() const {
    return registry + "/" + repository;
}

std::string ArtifactReference::string() const {
    auto output = std::stringstream{};
    output << getFullName();
    if (!tag.empty()){
        output << ":" << tag;
    }
    if (!digest.empty()){
        output << "@" << digest;
    }
    return output.str();
}

/**
 * Clears the tag when a digest is also present: the digest alone identifies
 * the artifact, as registries do when given both.
 */
ArtifactReference ArtifactReference::normalize() const {
    auto output = *this;
    if (!digest.empty() && !tag.empty()){
        output.tag.clear();
    }
    return output;
}

bool operator==(const ArtifactReference& lhs, const ArtifactReference& rhs) {
    return lhs.registry == rhs.registry
        && lhs.repository == rhs.repository
        && lhs.tag == rhs.tag
        && lhs.digest == rhs.digest;
}

std::ostream& operator<<(std::ostream& os, const ArtifactReference& reference) {
    os << reference.string();
    return os;
}

}
}
