/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "packaging/regex.hpp"

#include <sstream>


namespace ebpfoci {
namespace packaging {
namespace regex {
namespace strings {

// Lower case letters and digits, the atom of repository path components.
const std::string alphaNumeric{"[a-z0-9]+"};

// One period, one or two underscores, or any number of dashes.
const std::string separator{"(?:[._]|__|[-]+)"};

const std::string pathComponent = concatenate({ alphaNumeric,
                                                optional(repeated(separator + alphaNumeric))
                                              });

const std::string domainNameComponent{"(?:[a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9-]*[a-zA-Z0-9])"};

// Compressed or uncompressed IPv6 only, no zone identifiers (RFC 5952).
const std::string ipv6Address{"\\[(?:[a-fA-F0-9:]+)\\]"};

const std::string port{"\\:[0-9]+"};

const std::string domainName = concatenate({ domainNameComponent,
                                             optional(repeated("\\." + domainNameComponent))
                                           });

const std::string host = group(concatenate({domainName, "|", ipv6Address}));

const std::string domain = host + optional(port);

// <namespace>/<name>, one or more slash-separated path components
const std::string remoteName = concatenate({ pathComponent,
                                             optional(repeated("\\/" + pathComponent))
                                           });

const std::string tag{"[\\w][\\w.-]{0,127}"};

const std::string digest{"[A-Za-z][A-Za-z0-9]*(?:[-_+.][A-Za-z][A-Za-z0-9]*)*[:][0-9A-Fa-f]{32,}"};

// Artifacts always live in an explicit registry, so unlike image references
// the domain is mandatory. Capturing groups: domain, remote name, tag, digest.
const std::string reference = anchored(capture(domain)
                                       + "\\/"
                                       + capture(remoteName)
                                       + optional("\\:" + capture(tag))
                                       + optional("\\@" + capture(digest))
                                      );

std::string concatenate(const std::initializer_list<std::string> expr) {
    auto output = std::stringstream{};
    for (const auto& exp : expr) {
        output << exp;
    }
    return output.str();
}

std::string optional(const std::string& expr) {
    return group(expr) + "?";
}

std::string repeated(const std::string& expr) {
    return group(expr) + "+";
}

std::string group(const std::string& expr) {
    return "(?:" + expr + ")";
}

std::string capture(const std::string& expr) {
    return "(" + expr + ")";
}

std::string anchored(const std::string& expr) {
    return "^" + expr + "$";
}

} // namespace

const boost::regex reference(strings::reference);

} // namespace
} // namespace
} // namespace
