/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#define BOOST_TEST_MODULE sink_config

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>
#include <boost/test/unit_test.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include "filesinks/sink_config.hh"

using namespace filesinks;
using namespace std::chrono_literals;

namespace {

const std::string minimal = R"(
bucket: logs
file_strategy:
  working_dir: tmp/inflight
  publish_dir: done
)";

gcs_sink_config decode(const std::string& yaml) {
    return gcs_sink_config::decode(YAML::Load(yaml));
}

// Expects decoding to fail with a message mentioning `needle`
void require_rejected(const std::string& yaml, std::string_view needle) {
    try {
        decode(yaml);
    } catch (const configuration_error& e) {
        BOOST_TEST_MESSAGE(e.what());
        BOOST_REQUIRE_MESSAGE(std::string_view(e.what()).find(needle) != std::string_view::npos,
                              fmt::format("'{}' does not mention {}", e.what(), needle));
        return;
    }
    BOOST_FAIL(fmt::format("accepted: {}", yaml));
}

} // anonymous namespace

BOOST_AUTO_TEST_CASE(test_defaults) {
    auto cfg = decode(minimal);
    BOOST_REQUIRE_EQUAL(cfg.endpoint, "https://storage.googleapis.com");
    BOOST_REQUIRE_EQUAL(cfg.bucket, "logs");
    BOOST_REQUIRE(!cfg.max_connections);
    BOOST_REQUIRE_EQUAL(cfg.schema, "");
    BOOST_REQUIRE_EQUAL(cfg.file_strategy.working_dir, "tmp/inflight");
    BOOST_REQUIRE_EQUAL(cfg.file_strategy.publish_dir, "done");
    BOOST_REQUIRE_EQUAL(cfg.file_strategy.sync_file_after_records, 1000u);
    BOOST_REQUIRE(cfg.file_strategy.sync_file_after_duration == 30s);
    BOOST_REQUIRE(cfg.file_strategy.roll_every == 1h);
    BOOST_REQUIRE_EQUAL(cfg.retry.max_attempts, 10u);
    BOOST_REQUIRE(cfg.retry.initial_retry_delay == 1s);
    BOOST_REQUIRE_EQUAL(cfg.retry.retry_delay_multiplier, 2.0);
    BOOST_REQUIRE(cfg.retry.max_retry_delay == 64s);
    BOOST_REQUIRE(cfg.retry.total_timeout == 10min);
}

BOOST_AUTO_TEST_CASE(test_full_configuration) {
    auto cfg = decode(R"(
endpoint: http://127.0.0.1:4443
bucket: logs
max_connections: 8
schema: '{"type":"string"}'
file_strategy:
  working_dir: w
  publish_dir: p
  sync_file_after_records: 50
  sync_file_after_duration_ms: 2500
  roll_every_ms: 60000
retry_settings:
  max_attempts: 4
  initial_retry_delay_ms: 0
  retry_delay_multiplier: 1.5
  max_retry_delay_ms: 800
  total_timeout_ms: 0
)");
    BOOST_REQUIRE_EQUAL(cfg.endpoint, "http://127.0.0.1:4443");
    BOOST_REQUIRE_EQUAL(cfg.max_connections.value_or(0), 8u);
    BOOST_REQUIRE_EQUAL(cfg.schema, "{\"type\":\"string\"}");
    BOOST_REQUIRE_EQUAL(cfg.file_strategy.sync_file_after_records, 50u);
    BOOST_REQUIRE(cfg.file_strategy.sync_file_after_duration == 2500ms);
    BOOST_REQUIRE(cfg.file_strategy.roll_every == 1min);
    BOOST_REQUIRE_EQUAL(cfg.retry.max_attempts, 4u);
    BOOST_REQUIRE(cfg.retry.initial_retry_delay == 0ms);
    BOOST_REQUIRE_EQUAL(cfg.retry.retry_delay_multiplier, 1.5);
    BOOST_REQUIRE(cfg.retry.max_retry_delay == 800ms);
    BOOST_REQUIRE(cfg.retry.total_timeout == 0ms);

    auto strategy = cfg.retry.make_retry_strategy();
    BOOST_REQUIRE_EQUAL(strategy->get_max_attempts(), 4u);
    // zero means no limit
    BOOST_REQUIRE(!strategy->get_total_timeout());

    BOOST_TEST_MESSAGE(fmt::format("{}", cfg));
}

BOOST_AUTO_TEST_CASE(test_missing_keys) {
    require_rejected("bucket: logs", "file_strategy");
    require_rejected(R"(
file_strategy:
  working_dir: w
  publish_dir: p
)", "bucket");
    require_rejected(R"(
bucket: logs
file_strategy:
  publish_dir: p
)", "file_strategy.working_dir");
    require_rejected(R"(
bucket: logs
file_strategy:
  working_dir: w
)", "file_strategy.publish_dir");
    require_rejected("- just\n- a list\n", "Could not decode");
}

BOOST_AUTO_TEST_CASE(test_invalid_values) {
    require_rejected(minimal + "max_connections: 0\n", "max_connections");
    require_rejected(minimal + "retry_settings:\n  max_attempts: 0\n", "retry_settings.max_attempts");
    require_rejected(minimal + "retry_settings:\n  max_attempts: lots\n", "retry_settings.max_attempts");
    require_rejected(minimal + "retry_settings:\n  retry_delay_multiplier: 0.5\n", "retry_delay_multiplier");
    require_rejected(minimal + "retry_settings:\n  initial_retry_delay_ms: 100\n  max_retry_delay_ms: 10\n", "max_retry_delay_ms");
    require_rejected(minimal + "retry_settings:\n  total_timeout_ms: -1\n", "retry_settings.total_timeout_ms");
    require_rejected(minimal + "retry_settings: 3\n", "retry_settings");
    require_rejected(R"(
bucket: ""
file_strategy:
  working_dir: w
  publish_dir: p
)", "bucket");
    require_rejected(R"(
bucket: logs
file_strategy:
  working_dir: w
  publish_dir: p
  sync_file_after_records: 0
)", "file_strategy.sync_file_after_records");
    require_rejected(R"(
bucket: logs
file_strategy:
  working_dir: w
  publish_dir: p
  sync_file_after_duration_ms: 0
)", "file_strategy.sync_file_after_duration_ms");
}

BOOST_AUTO_TEST_CASE(test_load_from_file) {
    char path[] = "/tmp/sink_config_testXXXXXX";
    int fd = ::mkstemp(path);
    BOOST_REQUIRE(fd >= 0);
    ::close(fd);
    {
        std::ofstream out(path);
        out << minimal;
    }
    auto cfg = load_sink_config(path);
    BOOST_REQUIRE_EQUAL(cfg.bucket, "logs");
    std::remove(path);

    BOOST_REQUIRE_THROW(load_sink_config("/nonexistent/sink.yaml"), configuration_error);
}
