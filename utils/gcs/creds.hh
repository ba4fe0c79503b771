/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <map>
#include <string>
#include <fmt/core.h>

namespace gcs {

struct credentials {
    std::string access_token;
    // Extra headers every request must carry, e.g. x-goog-user-project
    std::map<std::string, std::string> headers;

    explicit operator bool() const noexcept { return !access_token.empty(); }
};

} // namespace gcs

template <>
struct fmt::formatter<gcs::credentials> : fmt::formatter<string_view> {
    auto format(const gcs::credentials& c, fmt::format_context& ctx) const {
        // never print the token itself
        return fmt::format_to(ctx.out(), "credentials{{token={}, headers={}}}", c.access_token.empty() ? "<none>" : "<redacted>", c.headers.size());
    }
};
