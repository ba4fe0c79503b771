/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <fmt/core.h>
#include "utils/gcs/retry_strategy.hh"

namespace YAML {
class Node;
}

namespace filesinks {

class configuration_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct retry_settings {
    unsigned max_attempts = 10;
    std::chrono::milliseconds initial_retry_delay{1000};
    double retry_delay_multiplier = 2.0;
    std::chrono::milliseconds max_retry_delay{64000};
    // zero means no limit
    std::chrono::milliseconds total_timeout{600000};

    std::unique_ptr<gcs::retry_strategy> make_retry_strategy() const;
};

struct file_strategy_config {
    std::string working_dir;
    std::string publish_dir;
    // Also the capacity of the record buffer of every file
    size_t sync_file_after_records = 1000;
    std::chrono::milliseconds sync_file_after_duration{30000};
    std::chrono::milliseconds roll_every{3600000};
};

struct gcs_sink_config {
    std::string endpoint = "https://storage.googleapis.com";
    std::string bucket;
    std::optional<unsigned> max_connections;
    // Opaque, stored in the header of every file
    std::string schema;
    file_strategy_config file_strategy;
    retry_settings retry;

    static gcs_sink_config decode(const YAML::Node& node);
};

gcs_sink_config load_sink_config(const std::filesystem::path& path);

} // namespace filesinks

template <>
struct fmt::formatter<filesinks::gcs_sink_config> : fmt::formatter<string_view> {
    auto format(const filesinks::gcs_sink_config& cfg, fmt::format_context& ctx) const -> decltype(ctx.out());
};
