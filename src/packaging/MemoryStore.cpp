/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "MemoryStore.hpp"

#include <boost/format.hpp>

#include "libebpfoci/Error.hpp"
#include "packaging/MediaTypes.hpp"

namespace ebpfoci {
namespace packaging {

Descriptor MemoryStore::add(const std::string& name, const std::string& mediaType, const std::string& bytes) {
    if(name.empty()) {
        EBPFOCI_THROW_ERROR("Failed to add blob to memory store: empty name");
    }
    auto descriptor = makeDescriptor(mediaType, bytes, Annotations{{annotation::title, name}});
    set(descriptor, bytes);
    return descriptor;
}

void MemoryStore::set(const Descriptor& descriptor, const std::string& bytes) {
    verify(descriptor, bytes);
    blobs[descriptor.digest.string()] = bytes;

    auto title = descriptor.getTitle();
    if(title) {
        descriptorsByName[*title] = descriptor;
    }
}

void MemoryStore::storeManifest(const std::string& reference, const Descriptor& descriptor, const std::string& bytes) {
    if(reference.empty()) {
        EBPFOCI_THROW_ERROR("Failed to store manifest in memory store: empty reference");
    }
    verify(descriptor, bytes);
    blobs[descriptor.digest.string()] = bytes;
    manifestsByReference[reference] = descriptor;
}

Descriptor MemoryStore::resolve(const std::string& reference) const {
    auto it = manifestsByReference.find(reference);
    if(it == manifestsByReference.cend()) {
        auto message = boost::format("Failed to resolve reference '%s': not found in memory store") % reference;
        EBPFOCI_THROW_ERROR(message.str());
    }
    return it->second;
}

const std::string& MemoryStore::fetch(const Descriptor& descriptor) const {
    auto it = blobs.find(descriptor.digest.string());
    if(it == blobs.cend()) {
        auto message = boost::format("Failed to fetch blob %s: not found in memory store") % descriptor.digest;
        EBPFOCI_THROW_ERROR(message.str());
    }
    return it->second;
}

boost::optional<std::pair<Descriptor, std::string>> MemoryStore::getByName(const std::string& name) const {
    auto it = descriptorsByName.find(name);
    if(it == descriptorsByName.cend()) {
        return {};
    }
    return std::make_pair(it->second, fetch(it->second));
}

bool MemoryStore::contains(const Descriptor& descriptor) const {
    return blobs.find(descriptor.digest.string()) != blobs.cend();
}

void MemoryStore::verify(const Descriptor& descriptor, const std::string& bytes) const {
    if(descriptor.size != bytes.size()) {
        auto message = boost::format("Blob %s has size %d, but its descriptor declares %d bytes")
            % descriptor.digest % bytes.size() % descriptor.size;
        EBPFOCI_THROW_ERROR(message.str());
    }
    if(!descriptor.digest.matches(bytes)) {
        auto message = boost::format("Digest mismatch: expected %s, got %s")
            % descriptor.digest % Digest::fromBytes(bytes);
        EBPFOCI_THROW_ERROR(message.str());
    }
}

}}
