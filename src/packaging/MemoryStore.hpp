/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_packaging_MemoryStore_hpp
#define ebpfoci_packaging_MemoryStore_hpp

#include <string>
#include <unordered_map>
#include <utility>

#include <boost/optional.hpp>

#include "packaging/Descriptor.hpp"

namespace ebpfoci {
namespace packaging {

/**
 * In-memory content-addressed store used to stage the blobs and the manifest
 * of an artifact during a single push or pull.
 *
 * Blobs are keyed by digest. Blobs carrying a title annotation are also
 * indexed by that title, and manifests are tagged with a reference.
 */
class MemoryStore {
public:
    Descriptor add(const std::string& name, const std::string& mediaType, const std::string& bytes);
    void set(const Descriptor& descriptor, const std::string& bytes);
    void storeManifest(const std::string& reference, const Descriptor& descriptor, const std::string& bytes);

    Descriptor resolve(const std::string& reference) const;
    const std::string& fetch(const Descriptor& descriptor) const;
    boost::optional<std::pair<Descriptor, std::string>> getByName(const std::string& name) const;
    bool contains(const Descriptor& descriptor) const;

private:
    void verify(const Descriptor& descriptor, const std::string& bytes) const;

private:
    std::unordered_map<std::string, std::string> blobs;
    std::unordered_map<std::string, Descriptor> descriptorsByName;
    std::unordered_map<std::string, Descriptor> manifestsByReference;
};

}}

#endif
