/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_packaging_ArtifactReference_hpp
#define ebpfoci_packaging_ArtifactReference_hpp

#include <string>
#include <ostream>


namespace ebpfoci {
namespace packaging {

struct ArtifactReference {
    std::string registry;
    std::string repository;
    std::string tag;
    std::string digest;

    static ArtifactReference parse(const std::string& input);

    std::string getFullName() const;
    std::string string() const;
    ArtifactReference normalize() const;

    static const std::string DEFAULT_TAG;
};

bool operator==(const ArtifactReference&, const ArtifactReference&);

std::ostream& operator<<(std::ostream&, const ArtifactReference&);

}
}

#endif
