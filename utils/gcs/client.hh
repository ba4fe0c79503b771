/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <seastar/core/iostream.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/http/client.hh>
#include <seastar/util/noncopyable_function.hh>
#include "utils/gcs/credentials_providers/credentials_provider.hh"
#include "utils/gcs/retry_strategy.hh"
#include "utils/gcs/retryable_http_client.hh"
#include "utils/gcs/utils/client_utils.hh"

namespace gcs {

inline constexpr std::string_view octet_stream_content_type = "application/octet-stream";
inline constexpr std::string_view json_content_type = "application/json";
// Returned when an ifGenerationMatch precondition does not hold
inline constexpr auto precondition_failed = seastar::http::reply::status_type(412);

// Produces an upload body. It may be called more than once for the same
// upload, once per attempt, and must write the same bytes every time.
using body_writer = seastar::noncopyable_function<seastar::future<>(seastar::output_stream<char>&)>;

// Google Cloud Storage JSON API client. Holds the connection pool, the
// credentials provider and the retry strategy, nothing else. One instance can
// serve any number of concurrent callers on its shard.
class client : public seastar::enable_shared_from_this<client> {
    std::string _host;
    seastar::shared_ptr<credentials_provider> _creds_provider;
    std::unique_ptr<retry_strategy> _retry_strategy;
    no_retry_strategy _no_retry;
    retryable_http_client _http;

    struct private_tag {};

    seastar::future<> authorize(seastar::http::request& req);

public:
    client(std::unique_ptr<seastar::http::experimental::connection_factory> factory,
           std::string host,
           seastar::shared_ptr<credentials_provider> creds_provider,
           std::unique_ptr<retry_strategy> rs,
           unsigned max_conn,
           private_tag);

    // `endpoint` is a URI without a path, e.g. https://storage.googleapis.com
    static seastar::shared_ptr<client> make(std::string endpoint,
                                            seastar::shared_ptr<credentials_provider> creds_provider,
                                            std::unique_ptr<retry_strategy> rs = nullptr,
                                            std::optional<unsigned> max_conn = std::nullopt);
    static seastar::shared_ptr<client> make(std::unique_ptr<seastar::http::experimental::connection_factory> factory,
                                            std::string host,
                                            seastar::shared_ptr<credentials_provider> creds_provider,
                                            std::unique_ptr<retry_strategy> rs = nullptr,
                                            std::optional<unsigned> max_conn = std::nullopt);

    // A failed upload may still have stored an object, possibly a truncated
    // one if the writer failed midway
    seastar::future<object_metadata> upload_object(std::string bucket,
                                                   std::string object_name,
                                                   body_writer writer,
                                                   std::string content_type = std::string(octet_stream_content_type));
    // Concatenates the sources, in order, into destination. With
    // if_generation_match set the compose only happens while destination is
    // at that generation, "0" meaning it must not exist yet.
    seastar::future<object_metadata> compose_object(std::string bucket,
                                                    std::string destination,
                                                    compose_request req,
                                                    std::optional<std::string> if_generation_match = std::nullopt);
    seastar::future<object_metadata> get_object_metadata(std::string bucket, std::string object_name);
    seastar::future<> delete_object(std::string bucket, std::string object_name);
    // Single attempt, no retries
    seastar::future<bucket_metadata> get_bucket(std::string bucket);

    seastar::future<credentials> get_credentials();
    const credentials_provider& get_credentials_provider() const noexcept { return *_creds_provider; }
    const retry_strategy& get_retry_strategy() const noexcept { return *_retry_strategy; }

    seastar::future<> close();
};

} // namespace gcs
