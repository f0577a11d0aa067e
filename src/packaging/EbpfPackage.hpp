/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_packaging_EbpfPackage_hpp
#define ebpfoci_packaging_EbpfPackage_hpp

#include <string>


namespace ebpfoci {
namespace packaging {

/**
 * Metadata shipped alongside an eBPF program, stored as the config blob
 * of the artifact: {"info": "<string>"}.
 */
struct EbpfConfig {
    std::string info;

    std::string encode() const;
    static EbpfConfig decode(const std::string& bytes);
};

struct EbpfPackage {
    std::string programFileBytes; // compiled eBPF object, opaque binary
    EbpfConfig ebpfConfig;
};

bool operator==(const EbpfConfig&, const EbpfConfig&);
bool operator==(const EbpfPackage&, const EbpfPackage&);

}
}

#endif
