/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_packaging_Manifest_hpp
#define ebpfoci_packaging_Manifest_hpp

#include <string>
#include <vector>

#include "packaging/Descriptor.hpp"

namespace ebpfoci {
namespace packaging {

/**
 * OCI image manifest (schema version 2) binding a config blob and its layers.
 */
struct Manifest {
    Descriptor config;
    std::vector<Descriptor> layers;
    Annotations annotations;

    static Manifest generate(const Descriptor& config,
                             const std::vector<Descriptor>& layers,
                             const Annotations& annotations = {});
    static Manifest parse(const std::string& bytes);

    std::string serialize() const;
    std::vector<Descriptor> getReferencedBlobs() const;

    static const int schemaVersion;
};

}}

#endif
