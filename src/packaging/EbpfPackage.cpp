/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "packaging/EbpfPackage.hpp"

#include <rapidjson/document.h>

#include "libebpfoci/Error.hpp"
#include "libebpfoci/utility/json.hpp"

namespace rj = rapidjson;

namespace ebpfoci {
namespace packaging {

std::string EbpfConfig::encode() const {
    auto json = rj::Document{rj::kObjectType};
    auto& allocator = json.GetAllocator();
    json.AddMember("info", rj::Value{info.c_str(), static_cast<rj::SizeType>(info.size()), allocator}, allocator);
    return libebpfoci::json::serialize(json);
}

/**
 * Unknown members are ignored and a missing "info" decodes to an empty string.
 */
EbpfConfig EbpfConfig::decode(const std::string& bytes) {
    try {
        auto json = libebpfoci::json::parse(bytes);
        if(!json.IsObject()) {
            EBPFOCI_THROW_ERROR("eBPF config is not a JSON object");
        }

        auto config = EbpfConfig{};
        auto info = json.FindMember("info");
        if(info != json.MemberEnd()) {
            if(!info->value.IsString()) {
                EBPFOCI_THROW_ERROR("\"info\" of eBPF config is not a string");
            }
            config.info = std::string(info->value.GetString(), info->value.GetStringLength());
        }
        return config;
    }
    catch(const std::exception& e) {
        EBPFOCI_RETHROW_ERROR(e, "Failed to decode eBPF config");
    }
}

bool operator==(const EbpfConfig& lhs, const EbpfConfig& rhs) {
    return lhs.info == rhs.info;
}

bool operator==(const EbpfPackage& lhs, const EbpfPackage& rhs) {
    return lhs.programFileBytes == rhs.programFileBytes
        && lhs.ebpfConfig == rhs.ebpfConfig;
}

}
}
