/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>
#include <string>
#include <seastar/http/client.hh>
#include <seastar/util/noncopyable_function.hh>
#include "gcs_error.hh"
#include "retry_strategy.hh"

namespace gcs {

// Runs one logical remote operation under a retry strategy. Every attempt
// ends in either success or a gcs_error; retriable errors are retried after
// the strategy's backoff, anything else is thrown as gcs_exception.
class retryable_http_client {
public:
    // Called before every attempt, so each one carries fresh credentials
    using authorizer = seastar::noncopyable_function<seastar::future<>(seastar::http::request&)>;

    retryable_http_client(std::unique_ptr<seastar::http::experimental::connection_factory>&& factory,
                          unsigned max_conn,
                          authorizer authorize,
                          const retry_strategy& retry_strategy);

    // `expected` unset accepts any 2xx status. The request body writer, if
    // any, is run once per attempt.
    seastar::future<> make_request(std::string operation,
                                   seastar::http::request req,
                                   seastar::http::experimental::client::reply_handler handle,
                                   std::optional<seastar::http::reply::status_type> expected = std::nullopt);
    seastar::future<> make_request(std::string operation,
                                   seastar::http::request req,
                                   seastar::http::experimental::client::reply_handler handle,
                                   std::optional<seastar::http::reply::status_type> expected,
                                   const retry_strategy& strategy);
    seastar::future<> close();

private:
    seastar::future<std::optional<gcs_error>> do_attempt(seastar::http::request& req,
                                                          seastar::http::experimental::client::reply_handler& handler,
                                                          std::optional<gcs_error>& reply_error);

    seastar::http::experimental::client _http;
    authorizer _authorize;
    const retry_strategy& _retry_strategy;
};

} // namespace gcs
