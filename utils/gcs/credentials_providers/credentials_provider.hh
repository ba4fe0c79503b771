/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <seastar/core/future.hh>
#include "utils/gcs/creds.hh"

namespace gcs {

// Hands out a short-lived bearer token on demand. The client asks for
// credentials before every request and never keeps them.
class credentials_provider {
public:
    virtual ~credentials_provider() = default;
    // Resolves to empty credentials when this provider has nothing to offer,
    // fails when it should have had something and could not get it.
    virtual seastar::future<credentials> get_credentials() = 0;
    virtual const char* get_name() const = 0;
};

} // namespace gcs
