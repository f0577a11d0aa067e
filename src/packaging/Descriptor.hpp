/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_packaging_Descriptor_hpp
#define ebpfoci_packaging_Descriptor_hpp

#include <cstdint>
#include <map>
#include <ostream>
#include <string>

#include <boost/optional.hpp>
#include <rapidjson/document.h>

#include "packaging/Digest.hpp"

namespace ebpfoci {
namespace packaging {

using Annotations = std::map<std::string, std::string>;

/**
 * OCI content descriptor: identifies a blob by media type, digest and size.
 */
struct Descriptor {
    std::string mediaType;
    Digest digest;
    std::uint64_t size = 0;
    Annotations annotations;

    boost::optional<std::string> getTitle() const;

    static Descriptor fromJSON(const rapidjson::Value& json);
    rapidjson::Value toJSON(rapidjson::Document::AllocatorType& allocator) const;
};

Annotations annotationsFromJSON(const rapidjson::Value& json);
rapidjson::Value annotationsToJSON(const Annotations& annotations, rapidjson::Document::AllocatorType& allocator);

Descriptor makeDescriptor(const std::string& mediaType, const std::string& bytes, const Annotations& annotations = {});

bool operator==(const Descriptor&, const Descriptor&);
bool operator!=(const Descriptor&, const Descriptor&);
std::ostream& operator<<(std::ostream&, const Descriptor&);

}}

#endif
