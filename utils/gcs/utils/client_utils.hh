/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <fmt/core.h>

namespace gcs {

// Body of the objects.compose call. Sources are concatenated in order.
struct compose_request {
    std::string content_type;
    std::vector<std::string> source_objects;
};

// The subset of the object resource this code cares about
struct object_metadata {
    std::string bucket;
    std::string name;
    std::string content_type;
    std::string generation;
    std::string crc32c;
    uint64_t size = 0;
    unsigned component_count = 1;
};

struct bucket_metadata {
    std::string id;
    std::string name;
    std::string location;
    std::string storage_class;
};

std::string dump_compose_request(const compose_request& req);
compose_request parse_compose_request(std::string_view body);

std::string dump_object_metadata(const object_metadata& md);
object_metadata parse_object_metadata(std::string_view body);

std::string dump_bucket_metadata(const bucket_metadata& md);
bucket_metadata parse_bucket_metadata(std::string_view body);

// GCS wraps errors as {"error": {"code": 404, "message": "..."}}, but some
// front ends answer with plain text. Returns the message of the envelope if
// the body is one.
std::optional<std::string> parse_error_message(std::string_view body);
std::string dump_error(int code, std::string_view message);

} // namespace gcs

template <>
struct fmt::formatter<gcs::object_metadata> : fmt::formatter<string_view> {
    auto format(const gcs::object_metadata& md, fmt::format_context& ctx) const -> decltype(ctx.out());
};

template <>
struct fmt::formatter<gcs::bucket_metadata> : fmt::formatter<string_view> {
    auto format(const gcs::bucket_metadata& md, fmt::format_context& ctx) const -> decltype(ctx.out());
};
