/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "packaging/EbpfRegistry.hpp"

#include <boost/format.hpp>

#include "libebpfoci/Error.hpp"
#include "libebpfoci/utility/logging.hpp"
#include "packaging/ArtifactReference.hpp"
#include "packaging/Manifest.hpp"
#include "packaging/MediaTypes.hpp"
#include "packaging/MemoryStore.hpp"


namespace ebpfoci {
namespace packaging {

EbpfRegistry::EbpfRegistry(std::shared_ptr<const Registry> registry)
    : registry{std::move(registry)}
{
    if(!this->registry) {
        EBPFOCI_THROW_ERROR("Failed to create eBPF registry: no registry handle");
    }
}

void EbpfRegistry::push(const libebpfoci::Context& context,
                        const std::string& reference,
                        const EbpfPackage& package,
                        const Annotations& configAnnotations) const {
    libebpfoci::logMessage(boost::format("Pushing eBPF package (%d bytes) to '%s'")
                           % package.programFileBytes.size() % reference, libebpfoci::LogLevel::INFO);

    try {
        context.throwIfCancelled("Push");
        auto canonicalReference = canonicalize(reference);

        auto store = MemoryStore{};
        auto programDescriptor = store.add(programEntryName, mediaType::ebpfProgram, package.programFileBytes);

        auto configBytes = package.ebpfConfig.encode();
        auto configDescriptor = buildConfigDescriptor(configBytes, configAnnotations);
        store.set(configDescriptor, configBytes);

        auto manifest = Manifest::generate(configDescriptor, {programDescriptor});
        auto manifestBytes = manifest.serialize();
        store.storeManifest(canonicalReference, makeDescriptor(mediaType::ociManifest, manifestBytes), manifestBytes);

        context.throwIfCancelled("Push");
        registry->push(context, store, canonicalReference);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to push eBPF package to '%s'") % reference;
        EBPFOCI_RETHROW_ERROR(e, message.str());
    }

    libebpfoci::logMessage(boost::format("Successfully pushed eBPF package to '%s'") % reference,
                           libebpfoci::LogLevel::INFO);
}

EbpfPackage EbpfRegistry::pull(const libebpfoci::Context& context, const std::string& reference) const {
    libebpfoci::logMessage(boost::format("Pulling eBPF package from '%s'") % reference, libebpfoci::LogLevel::INFO);

    auto package = EbpfPackage{};

    try {
        context.throwIfCancelled("Pull");
        auto canonicalReference = canonicalize(reference);

        auto store = MemoryStore{};
        registry->pull(context, canonicalReference, store);

        auto program = store.getByName(programEntryName);
        if(!program) {
            auto message = boost::format("could not find %s in manifest of %s") % programEntryName % reference;
            EBPFOCI_THROW_ERROR(message.str());
        }

        auto config = store.getByName(configEntryName);
        if(!config) {
            auto message = boost::format("could not find %s in manifest of %s") % configEntryName % reference;
            EBPFOCI_THROW_ERROR(message.str());
        }

        package.programFileBytes = std::move(program->second);
        package.ebpfConfig = EbpfConfig::decode(config->second);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to pull eBPF package from '%s'") % reference;
        EBPFOCI_RETHROW_ERROR(e, message.str());
    }

    libebpfoci::logMessage(boost::format("Successfully pulled eBPF package from '%s'") % reference,
                           libebpfoci::LogLevel::INFO);
    return package;
}

std::string EbpfRegistry::canonicalize(const std::string& reference) const {
    if(reference.empty()) {
        EBPFOCI_THROW_ERROR("Invalid artifact reference: empty string");
    }
    return ArtifactReference::parse(reference).normalize().string();
}

std::unique_ptr<EbpfRegistry> makeEbpfRegistry(std::shared_ptr<const Registry> registry) {
    return std::unique_ptr<EbpfRegistry>{new EbpfRegistry{std::move(registry)}};
}

/**
 * Caller annotations are kept, but the title always names the config entry:
 * pull locates the config by that title.
 */
Descriptor buildConfigDescriptor(const std::string& configBytes, const Annotations& annotations) {
    auto merged = annotations;
    merged[annotation::title] = configEntryName;
    return makeDescriptor(mediaType::ebpfConfig, configBytes, merged);
}

}
}
