/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_packaging_MediaTypes_hpp
#define ebpfoci_packaging_MediaTypes_hpp

namespace ebpfoci {
namespace packaging {

namespace mediaType {

constexpr const char* ebpfProgram = "binary/ebpf.solo.io.v1";
constexpr const char* ebpfConfig = "application/ebpf.oci.image.config.v1+json";
constexpr const char* ociManifest = "application/vnd.oci.image.manifest.v1+json";
constexpr const char* ociIndex = "application/vnd.oci.image.index.v1+json";

}

namespace annotation {

constexpr const char* title = "org.opencontainers.image.title";
constexpr const char* refName = "org.opencontainers.image.ref.name";

}

// names of the two entries of an eBPF artifact
constexpr const char* programEntryName = "program.o";
constexpr const char* configEntryName = "config.json";

}}

#endif
