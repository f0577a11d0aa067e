/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_packaging_Digest_hpp
#define ebpfoci_packaging_Digest_hpp

#include <string>
#include <ostream>

namespace ebpfoci {
namespace packaging {

/**
 * Content address of a blob, rendered as "<algorithm>:<encoded>".
 * Only sha256 digests are computed and accepted.
 */
struct Digest {
    std::string algorithm;
    std::string encoded;

    static Digest fromBytes(const std::string& bytes);
    static Digest parse(const std::string& digest);

    std::string string() const;
    bool empty() const;
    bool matches(const std::string& bytes) const;

    static const std::string SHA256;
};

bool operator==(const Digest&, const Digest&);
bool operator!=(const Digest&, const Digest&);
bool operator<(const Digest&, const Digest&);
std::ostream& operator<<(std::ostream&, const Digest&);

}}

#endif
