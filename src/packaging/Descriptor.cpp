/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Descriptor.hpp"

#include <boost/format.hpp>

#include "libebpfoci/Error.hpp"
#include "packaging/MediaTypes.hpp"

namespace rj = rapidjson;

namespace ebpfoci {
namespace packaging {

boost::optional<std::string> Descriptor::getTitle() const {
    auto it = annotations.find(annotation::title);
    if(it == annotations.cend()) {
        return {};
    }
    return it->second;
}

Descriptor Descriptor::fromJSON(const rj::Value& json) {
    if(!json.IsObject()) {
        EBPFOCI_THROW_ERROR("Invalid descriptor: expected a JSON object");
    }

    auto descriptor = Descriptor{};

    auto mediaType = json.FindMember("mediaType");
    if(mediaType == json.MemberEnd() || !mediaType->value.IsString()) {
        EBPFOCI_THROW_ERROR("Invalid descriptor: missing or non-string \"mediaType\"");
    }
    descriptor.mediaType = mediaType->value.GetString();

    auto digest = json.FindMember("digest");
    if(digest == json.MemberEnd() || !digest->value.IsString()) {
        EBPFOCI_THROW_ERROR("Invalid descriptor: missing or non-string \"digest\"");
    }
    descriptor.digest = Digest::parse(digest->value.GetString());

    auto size = json.FindMember("size");
    if(size == json.MemberEnd() || !size->value.IsUint64()) {
        EBPFOCI_THROW_ERROR("Invalid descriptor: missing or negative \"size\"");
    }
    descriptor.size = size->value.GetUint64();

    auto annotations = json.FindMember("annotations");
    if(annotations != json.MemberEnd()) {
        descriptor.annotations = annotationsFromJSON(annotations->value);
    }

    return descriptor;
}

rj::Value Descriptor::toJSON(rj::Document::AllocatorType& allocator) const {
    auto json = rj::Value{rj::kObjectType};
    json.AddMember("mediaType", rj::Value{mediaType.c_str(), allocator}, allocator);
    json.AddMember("digest", rj::Value{digest.string().c_str(), allocator}, allocator);
    json.AddMember("size", rj::Value{size}, allocator);

    if(!annotations.empty()) {
        json.AddMember("annotations", annotationsToJSON(annotations, allocator), allocator);
    }

    return json;
}

Annotations annotationsFromJSON(const rj::Value& json) {
    if(!json.IsObject()) {
        EBPFOCI_THROW_ERROR("Invalid annotations: expected a JSON object");
    }
    auto annotations = Annotations{};
    for(const auto& annotation : json.GetObject()) {
        if(!annotation.value.IsString()) {
            auto message = boost::format("Invalid annotations: value of \"%s\" is not a string")
                % annotation.name.GetString();
            EBPFOCI_THROW_ERROR(message.str());
        }
        annotations[annotation.name.GetString()] = annotation.value.GetString();
    }
    return annotations;
}

rj::Value annotationsToJSON(const Annotations& annotations, rj::Document::AllocatorType& allocator) {
    auto json = rj::Value{rj::kObjectType};
    for(const auto& annotation : annotations) {
        json.AddMember(rj::Value{annotation.first.c_str(), allocator},
                       rj::Value{annotation.second.c_str(), allocator},
                       allocator);
    }
    return json;
}

Descriptor makeDescriptor(const std::string& mediaType, const std::string& bytes, const Annotations& annotations) {
    return Descriptor{mediaType, Digest::fromBytes(bytes), bytes.size(), annotations};
}

bool operator==(const Descriptor& lhs, const Descriptor& rhs) {
    return lhs.mediaType == rhs.mediaType
        && lhs.digest == rhs.digest
        && lhs.size == rhs.size
        && lhs.annotations == rhs.annotations;
}

bool operator!=(const Descriptor& lhs, const Descriptor& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const Descriptor& descriptor) {
    os << descriptor.mediaType << " " << descriptor.digest << " (" << descriptor.size << " bytes)";
    auto title = descriptor.getTitle();
    if(title) {
        os << " " << *title;
    }
    return os;
}

}}
