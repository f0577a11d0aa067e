/*
 * ebpfoci
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ebpfoci_packaging_Registry_hpp
#define ebpfoci_packaging_Registry_hpp

#include <string>

#include "libebpfoci/Context.hpp"
#include "packaging/MemoryStore.hpp"

namespace ebpfoci {
namespace packaging {

/**
 * Handle to a store of OCI artifacts.
 *
 * push() copies the manifest tagged with the given reference in the source store,
 * together with every blob it references, into the registry under that reference.
 * pull() copies them back into the destination store, tagged with the reference;
 * every blob is checked against the size and digest of its descriptor.
 *
 * Implementations are immutable once constructed, so a single handle can be
 * shared by concurrent push and pull calls.
 */
class Registry {
public:
    virtual ~Registry() = default;
    virtual void push(const libebpfoci::Context& context,
                      const MemoryStore& source,
                      const std::string& reference) const = 0;
    virtual void pull(const libebpfoci::Context& context,
                      const std::string& reference,
                      MemoryStore& destination) const = 0;
};

}}

#endif
