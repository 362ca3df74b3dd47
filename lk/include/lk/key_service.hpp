/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#pragma once
#include <string>
#include "lk/types.hpp"
#include "lk/join_resolver.hpp"
#include "lk/address_resolver.hpp"
#include "lk/direct_lookup.hpp"

namespace lk {

/**
 * Routes a lookup by which parameters are present:
 *   DevEUI              -> join admission (DevNonce required)
 *   DevAddr, no DevEUI  -> address fallback
 *   neither             -> BadRequest
 * Collaborator faults are not caught here.
 */
class KeyService {
public:
    KeyService(internal::CacheStore& store, internal::DeviceRegistry& registry,
               const JoinOptions& join_opt);

    LookupResult lookup(const LookupQuery& q);

    // Direct path; never touches the cache/lock store.
    LookupResult lookup_by_eui(const std::string& dev_eui);

private:
    JoinResolver    _join;
    AddressResolver _addr;
    DirectLookup    _direct;
};

} // namespace lk
