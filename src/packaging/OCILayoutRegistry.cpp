/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "OCILayoutRegistry.hpp"

#include <boost/format.hpp>

#include "libebpfoci/Error.hpp"
#include "libebpfoci/Flock.hpp"
#include "libebpfoci/Logger.hpp"
#include "libebpfoci/utility/filesystem.hpp"
#include "libebpfoci/utility/json.hpp"
#include "packaging/Manifest.hpp"
#include "packaging/MediaTypes.hpp"

namespace rj = rapidjson;

namespace ebpfoci {
namespace packaging {

// digest part of "name[:tag]@digest", empty if the name carries no digest
static std::string getDigestOfRefName(const std::string& refName) {
    auto atPosition = refName.rfind('@');
    return atPosition != std::string::npos ? refName.substr(atPosition + 1) : std::string{};
}

// "host[:port]/path" part of "host[:port]/path[:tag][@digest]"
static std::string getRepositoryOfRefName(const std::string& refName) {
    auto name = refName.substr(0, refName.find('@'));
    auto colonPosition = name.rfind(':');
    auto slashPosition = name.rfind('/');
    if(colonPosition != std::string::npos && (slashPosition == std::string::npos || colonPosition > slashPosition)) {
        name.erase(colonPosition);
    }
    return name;
}

static void checkDigestOfRefName(const std::string& refName, const Descriptor& manifestDescriptor) {
    auto digest = getDigestOfRefName(refName);
    if(!digest.empty() && digest != manifestDescriptor.digest.string()) {
        auto message = boost::format("reference '%s' does not match the digest %s of the manifest")
            % refName % manifestDescriptor.digest;
        EBPFOCI_THROW_ERROR(message.str());
    }
}

OCILayoutRegistry::OCILayoutRegistry(const boost::filesystem::path& layoutDir)
    : layoutDir{boost::filesystem::absolute(layoutDir)}
{}

void OCILayoutRegistry::push(const libebpfoci::Context& context,
                             const MemoryStore& source,
                             const std::string& reference) const {
    copyFrom(context, source, reference, reference);
}

void OCILayoutRegistry::pull(const libebpfoci::Context& context,
                             const std::string& reference,
                             MemoryStore& destination) const {
    copyTo(context, reference, destination, reference);
}

void OCILayoutRegistry::copyFrom(const libebpfoci::Context& context,
                                 const MemoryStore& source,
                                 const std::string& sourceReference,
                                 const std::string& refName) const {
    printLog(boost::format("Copying '%s' into OCI layout %s as '%s'") % sourceReference % layoutDir % refName,
             libebpfoci::LogLevel::INFO);

    try {
        context.throwIfCancelled("Push to OCI layout");

        auto manifestDescriptor = source.resolve(sourceReference);
        checkDigestOfRefName(refName, manifestDescriptor);
        const auto& manifestBytes = source.fetch(manifestDescriptor);
        auto manifest = Manifest::parse(manifestBytes);

        initializeLayout();

        // blobs first, so that index.json never references missing content
        for(const auto& blob : manifest.getReferencedBlobs()) {
            context.throwIfCancelled("Push to OCI layout");
            writeBlob(blob, source.fetch(blob));
        }
        writeBlob(manifestDescriptor, manifestBytes);

        context.throwIfCancelled("Push to OCI layout");

        auto lock = libebpfoci::Flock{getLockfilePath(), libebpfoci::Flock::Type::writeLock, context};
        auto index = readIndex();
        auto& allocator = index.GetAllocator();
        auto& manifests = index["manifests"];

        for(auto it = manifests.Begin(); it != manifests.End();) {
            auto entry = Descriptor::fromJSON(*it);
            auto name = entry.annotations.find(annotation::refName);
            if(name != entry.annotations.cend() && name->second == refName) {
                printLog(boost::format("Replacing %s previously tagged '%s'") % entry.digest % refName,
                         libebpfoci::LogLevel::DEBUG);
                it = manifests.Erase(it);
            }
            else {
                ++it;
            }
        }

        auto entry = manifestDescriptor;
        entry.annotations[annotation::refName] = refName;
        manifests.PushBack(entry.toJSON(allocator), allocator);

        libebpfoci::filesystem::writeFileAtomically(libebpfoci::json::serialize(index), getIndexPath());
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to copy '%s' into OCI layout %s") % sourceReference % layoutDir;
        EBPFOCI_RETHROW_ERROR(e, message.str());
    }

    printLog(boost::format("Successfully copied '%s' into OCI layout") % sourceReference, libebpfoci::LogLevel::INFO);
}

void OCILayoutRegistry::copyTo(const libebpfoci::Context& context,
                               const std::string& refName,
                               MemoryStore& destination,
                               const std::string& destinationReference) const {
    printLog(boost::format("Copying '%s' from OCI layout %s") % refName % layoutDir, libebpfoci::LogLevel::INFO);

    try {
        context.throwIfCancelled("Pull from OCI layout");

        if(!boost::filesystem::exists(getIndexPath())) {
            auto message = boost::format("artifact '%s' not found: %s is not an OCI layout") % refName % layoutDir;
            EBPFOCI_THROW_ERROR(message.str());
        }

        auto lock = libebpfoci::Flock{getLockfilePath(), libebpfoci::Flock::Type::readLock, context};
        auto index = readIndex();
        auto manifestDescriptor = findManifest(index, refName);
        manifestDescriptor.annotations.erase(annotation::refName);
        checkDigestOfRefName(refName, manifestDescriptor);

        auto manifestBytes = readBlob(manifestDescriptor);
        destination.storeManifest(destinationReference, manifestDescriptor, manifestBytes);

        auto manifest = Manifest::parse(manifestBytes);
        for(const auto& blob : manifest.getReferencedBlobs()) {
            context.throwIfCancelled("Pull from OCI layout");
            destination.set(blob, readBlob(blob));
        }
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to copy '%s' from OCI layout %s") % refName % layoutDir;
        EBPFOCI_RETHROW_ERROR(e, message.str());
    }

    printLog(boost::format("Successfully copied '%s' from OCI layout") % refName, libebpfoci::LogLevel::INFO);
}

boost::filesystem::path OCILayoutRegistry::getBlobPath(const Digest& digest) const {
    return layoutDir / "blobs" / digest.algorithm / digest.encoded;
}

boost::filesystem::path OCILayoutRegistry::getIndexPath() const {
    return layoutDir / "index.json";
}

boost::filesystem::path OCILayoutRegistry::getLockfilePath() const {
    return layoutDir / "index.json.lock";
}

void OCILayoutRegistry::initializeLayout() const {
    libebpfoci::filesystem::createFoldersIfNecessary(layoutDir / "blobs" / Digest::SHA256);

    auto layoutFile = layoutDir / "oci-layout";
    if(!boost::filesystem::exists(layoutFile)) {
        printLog(boost::format("Initializing OCI layout %s") % layoutDir, libebpfoci::LogLevel::DEBUG);
        libebpfoci::filesystem::writeFileAtomically("{\"imageLayoutVersion\":\"1.0.0\"}", layoutFile);
    }
}

void OCILayoutRegistry::writeBlob(const Descriptor& descriptor, const std::string& bytes) const {
    auto path = getBlobPath(descriptor.digest);
    if(boost::filesystem::exists(path) && libebpfoci::filesystem::getFileSize(path) == descriptor.size) {
        printLog(boost::format("Blob %s already present") % descriptor.digest, libebpfoci::LogLevel::DEBUG);
        return;
    }
    printLog(boost::format("Writing blob %s") % descriptor, libebpfoci::LogLevel::DEBUG);
    libebpfoci::filesystem::writeFileAtomically(bytes, path);
}

std::string OCILayoutRegistry::readBlob(const Descriptor& descriptor) const {
    auto path = getBlobPath(descriptor.digest);
    if(!boost::filesystem::is_regular_file(path)) {
        auto message = boost::format("blob %s is missing from OCI layout %s") % descriptor.digest % layoutDir;
        EBPFOCI_THROW_ERROR(message.str());
    }
    printLog(boost::format("Reading blob %s") % descriptor, libebpfoci::LogLevel::DEBUG);
    return libebpfoci::filesystem::readFile(path);
}

rj::Document OCILayoutRegistry::readIndex() const {
    auto index = rj::Document{rj::kObjectType};

    if(boost::filesystem::exists(getIndexPath())) {
        index = libebpfoci::json::read(getIndexPath());
        if(!index.IsObject()) {
            auto message = boost::format("Invalid OCI index %s: not a JSON object") % getIndexPath();
            EBPFOCI_THROW_ERROR(message.str());
        }
    }
    else {
        auto& allocator = index.GetAllocator();
        index.AddMember("schemaVersion", rj::Value{Manifest::schemaVersion}, allocator);
        index.AddMember("mediaType", rj::Value{mediaType::ociIndex, allocator}, allocator);
    }

    if(!index.HasMember("manifests")) {
        index.AddMember("manifests", rj::Value{rj::kArrayType}, index.GetAllocator());
    }
    else if(!index["manifests"].IsArray()) {
        auto message = boost::format("Invalid OCI index %s: \"manifests\" is not an array") % getIndexPath();
        EBPFOCI_THROW_ERROR(message.str());
    }

    return index;
}

/**
 * Looks up the index entry named refName. A reference with a digest also
 * matches a manifest with that digest tagged under the same repository.
 */
Descriptor OCILayoutRegistry::findManifest(const rj::Document& index, const std::string& refName) const {
    auto digest = getDigestOfRefName(refName);
    auto repository = getRepositoryOfRefName(refName);

    auto digestMatch = boost::optional<Descriptor>{};

    for(const auto& entryJSON : index["manifests"].GetArray()) {
        auto entry = Descriptor::fromJSON(entryJSON);
        auto name = entry.annotations.find(annotation::refName);
        if(name != entry.annotations.cend() && name->second == refName) {
            return entry;
        }
        if(!digest.empty() && entry.digest.string() == digest && !digestMatch
           && name != entry.annotations.cend() && getRepositoryOfRefName(name->second) == repository) {
            digestMatch = entry;
        }
    }

    if(digestMatch) {
        return *digestMatch;
    }

    auto message = boost::format("artifact '%s' not found in OCI layout %s") % refName % layoutDir;
    EBPFOCI_THROW_ERROR(message.str());
}

void OCILayoutRegistry::printLog(const boost::format& message, libebpfoci::LogLevel level) const {
    libebpfoci::Logger::getInstance().log(message.str(), sysname, level);
}

}}
