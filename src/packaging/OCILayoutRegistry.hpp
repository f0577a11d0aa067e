/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_packaging_OCILayoutRegistry_hpp
#define ebpfoci_packaging_OCILayoutRegistry_hpp

#include <string>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libebpfoci/LogLevel.hpp"
#include "packaging/Registry.hpp"

namespace ebpfoci {
namespace packaging {

/**
 * Registry backed by an OCI image layout directory:
 *
 *   <layout>/oci-layout
 *   <layout>/index.json
 *   <layout>/blobs/sha256/<encoded digest>
 *
 * Each manifest is recorded in index.json with the reference as its
 * "org.opencontainers.image.ref.name" annotation. References carrying a
 * digest ("...@sha256:...") also resolve by manifest digest.
 */
class OCILayoutRegistry : public Registry {
public:
    OCILayoutRegistry(const boost::filesystem::path& layoutDir);

    void push(const libebpfoci::Context& context,
              const MemoryStore& source,
              const std::string& reference) const override;
    void pull(const libebpfoci::Context& context,
              const std::string& reference,
              MemoryStore& destination) const override;

    // Same as push/pull, but the reference in the layout (refName) may differ
    // from the reference in the memory store.
    void copyFrom(const libebpfoci::Context& context,
                  const MemoryStore& source,
                  const std::string& sourceReference,
                  const std::string& refName) const;
    void copyTo(const libebpfoci::Context& context,
                const std::string& refName,
                MemoryStore& destination,
                const std::string& destinationReference) const;

    const boost::filesystem::path& getLayoutDir() const { return layoutDir; }

private:
    boost::filesystem::path getBlobPath(const Digest& digest) const;
    boost::filesystem::path getIndexPath() const;
    boost::filesystem::path getLockfilePath() const;
    void initializeLayout() const;
    void writeBlob(const Descriptor& descriptor, const std::string& bytes) const;
    std::string readBlob(const Descriptor& descriptor) const;
    rapidjson::Document readIndex() const;
    Descriptor findManifest(const rapidjson::Document& index, const std::string& refName) const;
    void printLog(const boost::format& message, libebpfoci::LogLevel level) const;

private:
    boost::filesystem::path layoutDir;
    std::string sysname = "OCILayoutRegistry";
};

}}

#endif
