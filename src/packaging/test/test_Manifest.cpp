/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>

#include <rapidjson/document.h>

#include "libebpfoci/utility/json.hpp"
#include "packaging/Descriptor.hpp"
#include "packaging/Manifest.hpp"
#include "packaging/MediaTypes.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace rj = rapidjson;

namespace ebpfoci {
namespace packaging {
namespace test {

TEST_GROUP(ManifestTestGroup) {
};

TEST(ManifestTestGroup, makeDescriptor) {
    auto descriptor = makeDescriptor(mediaType::ebpfProgram, "program", Annotations{{annotation::title, "program.o"}});
    CHECK_EQUAL(std::string{mediaType::ebpfProgram}, descriptor.mediaType);
    CHECK(descriptor.digest == Digest::fromBytes("program"));
    CHECK_EQUAL(7u, descriptor.size);
    CHECK(descriptor.getTitle());
    CHECK_EQUAL(std::string{"program.o"}, *descriptor.getTitle());

    CHECK(!makeDescriptor(mediaType::ebpfProgram, "program").getTitle());
}

TEST(ManifestTestGroup, descriptorJSON) {
    auto descriptor = makeDescriptor(mediaType::ebpfConfig, "{}", Annotations{{"key", "value"}});

    auto document = rj::Document{};
    auto json = descriptor.toJSON(document.GetAllocator());
    CHECK_EQUAL(std::string{mediaType::ebpfConfig}, std::string{json["mediaType"].GetString()});
    CHECK_EQUAL(descriptor.digest.string(), std::string{json["digest"].GetString()});
    CHECK_EQUAL(2u, json["size"].GetUint64());
    CHECK_EQUAL(std::string{"value"}, std::string{json["annotations"]["key"].GetString()});

    CHECK(Descriptor::fromJSON(json) == descriptor);
}

TEST(ManifestTestGroup, descriptorWithoutAnnotationsOmitsThem) {
    auto document = rj::Document{};
    auto json = makeDescriptor(mediaType::ebpfProgram, "x").toJSON(document.GetAllocator());
    CHECK(!json.HasMember("annotations"));
}

TEST(ManifestTestGroup, invalidDescriptorJSON) {
    // missing digest
    auto json = libebpfoci::json::parse(R"({"mediaType":"binary/ebpf.solo.io.v1","size":3})");
    CHECK_THROWS(libebpfoci::Error, Descriptor::fromJSON(json));

    // invalid digest
    json = libebpfoci::json::parse(R"({"mediaType":"binary/ebpf.solo.io.v1","digest":"sha256:abc","size":3})");
    CHECK_THROWS(libebpfoci::Error, Descriptor::fromJSON(json));

    // negative size
    json = libebpfoci::json::parse(R"({"mediaType":"binary/ebpf.solo.io.v1",)"
                                   R"("digest":"sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad","size":-1})");
    CHECK_THROWS(libebpfoci::Error, Descriptor::fromJSON(json));

    // non-string annotation
    json = libebpfoci::json::parse(R"({"mediaType":"binary/ebpf.solo.io.v1",)"
                                   R"("digest":"sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad","size":3,)"
                                   R"("annotations":{"key":1}})");
    CHECK_THROWS(libebpfoci::Error, Descriptor::fromJSON(json));
}

TEST(ManifestTestGroup, generateAndParse) {
    auto config = makeDescriptor(mediaType::ebpfConfig, R"({"info":"test"})", Annotations{{annotation::title, "config.json"}});
    auto layer = makeDescriptor(mediaType::ebpfProgram, "program", Annotations{{annotation::title, "program.o"}});

    auto manifest = Manifest::generate(config, {layer});
    auto bytes = manifest.serialize();

    auto json = libebpfoci::json::parse(bytes);
    CHECK_EQUAL(2, json["schemaVersion"].GetInt());
    CHECK_EQUAL(std::string{mediaType::ociManifest}, std::string{json["mediaType"].GetString()});
    CHECK_EQUAL(1u, json["layers"].Size());
    CHECK(!json.HasMember("annotations"));

    auto parsed = Manifest::parse(bytes);
    CHECK(parsed.config == config);
    CHECK_EQUAL(1u, parsed.layers.size());
    CHECK(parsed.layers[0] == layer);
    CHECK(parsed.annotations.empty());

    // serialization is deterministic, hence so is the manifest digest
    CHECK_EQUAL(bytes, parsed.serialize());
}

TEST(ManifestTestGroup, manifestAnnotations) {
    auto config = makeDescriptor(mediaType::ebpfConfig, "{}");
    auto layer = makeDescriptor(mediaType::ebpfProgram, "program");
    auto manifest = Manifest::generate(config, {layer}, Annotations{{"org.opencontainers.image.created", "today"}});

    auto parsed = Manifest::parse(manifest.serialize());
    CHECK_EQUAL(std::string{"today"}, parsed.annotations["org.opencontainers.image.created"]);
}

TEST(ManifestTestGroup, referencedBlobs) {
    auto config = makeDescriptor(mediaType::ebpfConfig, "{}");
    auto layer0 = makeDescriptor(mediaType::ebpfProgram, "program0");
    auto layer1 = makeDescriptor(mediaType::ebpfProgram, "program1");

    auto blobs = Manifest::generate(config, {layer0, layer1}).getReferencedBlobs();
    CHECK_EQUAL(3u, blobs.size());
    CHECK(blobs[0] == config);
    CHECK(blobs[1] == layer0);
    CHECK(blobs[2] == layer1);
}

TEST(ManifestTestGroup, generateRejectsIncompleteDescriptors) {
    auto config = makeDescriptor(mediaType::ebpfConfig, "{}");
    auto layer = makeDescriptor(mediaType::ebpfProgram, "program");

    CHECK_THROWS(libebpfoci::Error, Manifest::generate(Descriptor{}, {layer}));
    CHECK_THROWS(libebpfoci::Error, Manifest::generate(config, {}));
    CHECK_THROWS(libebpfoci::Error, Manifest::generate(config, {Descriptor{}}));
}

TEST(ManifestTestGroup, parseRejectsInvalidManifests) {
    // not JSON
    CHECK_THROWS(libebpfoci::Error, Manifest::parse("not json"));
    // not an object
    CHECK_THROWS(libebpfoci::Error, Manifest::parse("[]"));
    // wrong schema version
    CHECK_THROWS(libebpfoci::Error, Manifest::parse(R"({"schemaVersion":1,"config":{},"layers":[]})"));
    // wrong media type
    CHECK_THROWS(libebpfoci::Error, Manifest::parse(
        R"({"schemaVersion":2,"mediaType":"application/vnd.oci.image.index.v1+json","config":{},"layers":[]})"));
    // missing config
    CHECK_THROWS(libebpfoci::Error, Manifest::parse(R"({"schemaVersion":2,"layers":[]})"));
    // missing layers
    auto config = makeDescriptor(mediaType::ebpfConfig, "{}");
    auto document = rj::Document{rj::kObjectType};
    auto& allocator = document.GetAllocator();
    document.AddMember("schemaVersion", 2, allocator);
    document.AddMember("config", config.toJSON(allocator), allocator);
    CHECK_THROWS(libebpfoci::Error, Manifest::parse(libebpfoci::json::serialize(document)));
}

}}}

EBPFOCI_UNITTEST_MAIN_FUNCTION();
