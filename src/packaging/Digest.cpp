/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Digest.hpp"

#include <boost/format.hpp>
#include <boost/regex.hpp>
#include <openssl/sha.h>

#include "libebpfoci/Error.hpp"
#include "libebpfoci/utility/string.hpp"

namespace ebpfoci {
namespace packaging {

const std::string Digest::SHA256{"sha256"};

Digest Digest::fromBytes(const std::string& bytes) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    ::SHA256(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), hash);
    return Digest{SHA256, libebpfoci::string::toHex(hash, SHA256_DIGEST_LENGTH)};
}

Digest Digest::parse(const std::string& digest) {
    static const auto sha256Regex = boost::regex{"^sha256:([a-f0-9]{64})$"};

    boost::smatch matches;
    if(!boost::regex_match(digest, matches, sha256Regex)) {
        auto message = boost::format("Invalid digest '%s': expected 'sha256:' followed by"
                                     " 64 lower-case hexadecimal characters") % digest;
        EBPFOCI_THROW_ERROR(message.str());
    }
    return Digest{SHA256, matches[1].str()};
}

std::string Digest::string() const {
    return algorithm + ":" + encoded;
}

bool Digest::empty() const {
    return algorithm.empty() && encoded.empty();
}

bool Digest::matches(const std::string& bytes) const {
    return *this == fromBytes(bytes);
}

bool operator==(const Digest& lhs, const Digest& rhs) {
    return lhs.algorithm == rhs.algorithm && lhs.encoded == rhs.encoded;
}

bool operator!=(const Digest& lhs, const Digest& rhs) {
    return !(lhs == rhs);
}

bool operator<(const Digest& lhs, const Digest& rhs) {
    return lhs.string() < rhs.string();
}

std::ostream& operator<<(std::ostream& os, const Digest& digest) {
    os << digest.string();
    return os;
}

}}
