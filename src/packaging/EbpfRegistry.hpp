/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_packaging_EbpfRegistry_hpp
#define ebpfoci_packaging_EbpfRegistry_hpp

#include <memory>
#include <string>

#include "libebpfoci/Context.hpp"
#include "packaging/Descriptor.hpp"
#include "packaging/EbpfPackage.hpp"
#include "packaging/Registry.hpp"


namespace ebpfoci {
namespace packaging {

/**
 * Stores eBPF packages in a registry as OCI artifacts: the config is the
 * manifest's config blob ("config.json") and the program is its only layer
 * ("program.o"). Each call stages content in its own MemoryStore, so one
 * instance can serve concurrent calls.
 */
class EbpfRegistry {
public:
    EbpfRegistry(std::shared_ptr<const Registry> registry);

    void push(const libebpfoci::Context& context,
              const std::string& reference,
              const EbpfPackage& package,
              const Annotations& configAnnotations = {}) const;
    EbpfPackage pull(const libebpfoci::Context& context, const std::string& reference) const;

private:
    std::string canonicalize(const std::string& reference) const;

private:
    std::shared_ptr<const Registry> registry;
};

std::unique_ptr<EbpfRegistry> makeEbpfRegistry(std::shared_ptr<const Registry> registry);

Descriptor buildConfigDescriptor(const std::string& configBytes, const Annotations& annotations = {});

}
}

#endif
