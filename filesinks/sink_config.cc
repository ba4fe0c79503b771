/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <yaml-cpp/yaml.h>
#include <boost/lexical_cast.hpp>
#include "sink_config.hh"

using namespace std::string_literals;

namespace filesinks {

std::unique_ptr<gcs::retry_strategy> retry_settings::make_retry_strategy() const {
    std::optional<std::chrono::milliseconds> timeout;
    if (total_timeout.count() > 0) {
        timeout = total_timeout;
    }
    return std::make_unique<gcs::exponential_retry_strategy>(max_attempts, initial_retry_delay, retry_delay_multiplier, max_retry_delay, timeout);
}

namespace {

// Looks up `key` and converts it, naming the key on failure
template <typename T>
T get_opt(const YAML::Node& node, const std::string& prefix, const std::string& key, T def) {
    auto tmp = node[key];
    if (!tmp) {
        return def;
    }
    try {
        return tmp.template as<T>();
    } catch (const YAML::Exception& e) {
        throw configuration_error(fmt::format("invalid value for {}{}: {}", prefix, key, e.what()));
    }
}

template <typename T>
T get_required(const YAML::Node& node, const std::string& prefix, const std::string& key) {
    if (!node[key]) {
        throw configuration_error(fmt::format("missing required key {}{}", prefix, key));
    }
    return get_opt<T>(node, prefix, key, T{});
}

std::chrono::milliseconds get_duration(const YAML::Node& node, const std::string& prefix, const std::string& key, std::chrono::milliseconds def, bool allow_zero) {
    auto value = get_opt<int64_t>(node, prefix, key, def.count());
    if (value < 0 || (!allow_zero && value == 0)) {
        throw configuration_error(fmt::format("{}{} must be {}, got {}", prefix, key, allow_zero ? "non-negative" : "positive", value));
    }
    return std::chrono::milliseconds(value);
}

file_strategy_config decode_file_strategy(const YAML::Node& node) {
    static const auto prefix = "file_strategy."s;
    if (!node || !node.IsMap()) {
        throw configuration_error("missing required section file_strategy");
    }
    file_strategy_config fs;
    fs.working_dir = get_required<std::string>(node, prefix, "working_dir");
    fs.publish_dir = get_required<std::string>(node, prefix, "publish_dir");
    auto records = get_opt<int64_t>(node, prefix, "sync_file_after_records", fs.sync_file_after_records);
    if (records <= 0) {
        throw configuration_error(fmt::format("{}sync_file_after_records must be positive, got {}", prefix, records));
    }
    fs.sync_file_after_records = size_t(records);
    fs.sync_file_after_duration = get_duration(node, prefix, "sync_file_after_duration_ms", fs.sync_file_after_duration, false);
    fs.roll_every = get_duration(node, prefix, "roll_every_ms", fs.roll_every, false);
    return fs;
}

retry_settings decode_retry_settings(const YAML::Node& node) {
    static const auto prefix = "retry_settings."s;
    retry_settings rs;
    if (!node) {
        return rs;
    }
    if (!node.IsMap()) {
        throw configuration_error("retry_settings must be a map");
    }
    auto attempts = get_opt<int64_t>(node, prefix, "max_attempts", rs.max_attempts);
    if (attempts <= 0) {
        throw configuration_error(fmt::format("{}max_attempts must be positive, got {}", prefix, attempts));
    }
    rs.max_attempts = unsigned(attempts);
    rs.initial_retry_delay = get_duration(node, prefix, "initial_retry_delay_ms", rs.initial_retry_delay, true);
    rs.retry_delay_multiplier = get_opt<double>(node, prefix, "retry_delay_multiplier", rs.retry_delay_multiplier);
    if (rs.retry_delay_multiplier < 1.0) {
        throw configuration_error(fmt::format("{}retry_delay_multiplier must be at least 1, got {}", prefix, rs.retry_delay_multiplier));
    }
    rs.max_retry_delay = get_duration(node, prefix, "max_retry_delay_ms", rs.max_retry_delay, true);
    if (rs.max_retry_delay < rs.initial_retry_delay) {
        throw configuration_error(fmt::format("{}max_retry_delay_ms is below initial_retry_delay_ms", prefix));
    }
    rs.total_timeout = get_duration(node, prefix, "total_timeout_ms", rs.total_timeout, true);
    return rs;
}

} // anonymous namespace

gcs_sink_config gcs_sink_config::decode(const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        throw configuration_error(fmt::format("Could not decode sink configuration: {}", boost::lexical_cast<std::string>(node)));
    }
    gcs_sink_config cfg;
    cfg.endpoint = get_opt(node, "", "endpoint", cfg.endpoint);
    cfg.bucket = get_required<std::string>(node, "", "bucket");
    if (cfg.bucket.empty()) {
        throw configuration_error("bucket must not be empty");
    }
    if (node["max_connections"]) {
        auto conns = get_opt<int64_t>(node, "", "max_connections", 0);
        if (conns <= 0) {
            throw configuration_error(fmt::format("max_connections must be positive, got {}", conns));
        }
        cfg.max_connections = unsigned(conns);
    }
    cfg.schema = get_opt(node, "", "schema", ""s);
    cfg.file_strategy = decode_file_strategy(node["file_strategy"]);
    cfg.retry = decode_retry_settings(node["retry_settings"]);
    return cfg;
}

gcs_sink_config load_sink_config(const std::filesystem::path& path) {
    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw configuration_error(fmt::format("cannot load {}: {}", path.string(), e.what()));
    }
    return gcs_sink_config::decode(node);
}

} // namespace filesinks

auto fmt::formatter<filesinks::gcs_sink_config>::format(const filesinks::gcs_sink_config& cfg, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "gcs_sink_config{{endpoint={}, bucket={}, working_dir={}, publish_dir={}, sync_file_after_records={}, max_attempts={}}}",
                          cfg.endpoint, cfg.bucket, cfg.file_strategy.working_dir, cfg.file_strategy.publish_dir,
                          cfg.file_strategy.sync_file_after_records, cfg.retry.max_attempts);
}
