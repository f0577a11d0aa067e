/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Manifest.hpp"

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libebpfoci/Error.hpp"
#include "libebpfoci/utility/json.hpp"
#include "packaging/MediaTypes.hpp"

namespace rj = rapidjson;

namespace ebpfoci {
namespace packaging {

const int Manifest::schemaVersion = 2;

Manifest Manifest::generate(const Descriptor& config,
                            const std::vector<Descriptor>& layers,
                            const Annotations& annotations) {
    if(config.mediaType.empty() || config.digest.empty()) {
        EBPFOCI_THROW_ERROR("Failed to generate manifest: config descriptor has no media type or digest");
    }
    if(layers.empty()) {
        EBPFOCI_THROW_ERROR("Failed to generate manifest: no layers");
    }
    for(const auto& layer : layers) {
        if(layer.mediaType.empty() || layer.digest.empty()) {
            auto message = boost::format("Failed to generate manifest: layer descriptor %s is incomplete") % layer;
            EBPFOCI_THROW_ERROR(message.str());
        }
    }
    return Manifest{config, layers, annotations};
}

Manifest Manifest::parse(const std::string& bytes) {
    try {
        auto json = libebpfoci::json::parse(bytes);
        if(!json.IsObject()) {
            EBPFOCI_THROW_ERROR("manifest is not a JSON object");
        }

        auto version = json.FindMember("schemaVersion");
        if(version == json.MemberEnd() || !version->value.IsInt() || version->value.GetInt() != schemaVersion) {
            auto message = boost::format("unsupported manifest schema version (expected %d)") % schemaVersion;
            EBPFOCI_THROW_ERROR(message.str());
        }

        auto mediaTypeMember = json.FindMember("mediaType");
        if(mediaTypeMember != json.MemberEnd()
           && (!mediaTypeMember->value.IsString() || mediaTypeMember->value.GetString() != std::string{mediaType::ociManifest})) {
            EBPFOCI_THROW_ERROR("unexpected manifest media type");
        }

        auto config = json.FindMember("config");
        if(config == json.MemberEnd()) {
            EBPFOCI_THROW_ERROR("manifest has no \"config\"");
        }

        auto manifest = Manifest{};
        manifest.config = Descriptor::fromJSON(config->value);

        auto layers = json.FindMember("layers");
        if(layers == json.MemberEnd() || !layers->value.IsArray()) {
            EBPFOCI_THROW_ERROR("manifest has no \"layers\" array");
        }
        for(const auto& layer : layers->value.GetArray()) {
            manifest.layers.push_back(Descriptor::fromJSON(layer));
        }

        auto annotations = json.FindMember("annotations");
        if(annotations != json.MemberEnd()) {
            manifest.annotations = annotationsFromJSON(annotations->value);
        }

        return manifest;
    }
    catch(const std::exception& e) {
        EBPFOCI_RETHROW_ERROR(e, "Failed to parse OCI manifest");
    }
}

std::string Manifest::serialize() const {
    auto json = rj::Document{rj::kObjectType};
    auto& allocator = json.GetAllocator();

    json.AddMember("schemaVersion", rj::Value{schemaVersion}, allocator);
    json.AddMember("mediaType", rj::Value{mediaType::ociManifest, allocator}, allocator);
    json.AddMember("config", config.toJSON(allocator), allocator);

    auto layersJSON = rj::Value{rj::kArrayType};
    for(const auto& layer : layers) {
        layersJSON.PushBack(layer.toJSON(allocator), allocator);
    }
    json.AddMember("layers", layersJSON, allocator);

    if(!annotations.empty()) {
        json.AddMember("annotations", annotationsToJSON(annotations, allocator), allocator);
    }

    return libebpfoci::json::serialize(json);
}

std::vector<Descriptor> Manifest::getReferencedBlobs() const {
    auto blobs = std::vector<Descriptor>{config};
    blobs.insert(blobs.end(), layers.cbegin(), layers.cend());
    return blobs;
}

}}
