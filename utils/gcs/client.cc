/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <exception>
#include <stdexcept>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/http/request.hh>
#include <seastar/util/short_streams.hh>
#include "utils/gcs/client.hh"
#include "utils/http.hh"
#include "utils/log.hh"

using namespace seastar;

namespace gcs {

logging::logger gcsl("gcs");

static future<> ignore_reply(const http::reply& rep, input_stream<char>&& in_) {
    auto in = std::move(in_);
    co_await util::skip_entire_stream(in);
}

static std::string object_path(std::string_view bucket, std::string_view object_name) {
    return fmt::format("/storage/v1/b/{}/o/{}", utils::http::encode_path_segment(bucket), utils::http::encode_path_segment(object_name));
}

client::client(std::unique_ptr<http::experimental::connection_factory> factory,
               std::string host,
               shared_ptr<credentials_provider> creds_provider,
               std::unique_ptr<retry_strategy> rs,
               unsigned max_conn,
               private_tag)
    : _host(std::move(host))
    , _creds_provider(std::move(creds_provider))
    , _retry_strategy(rs ? std::move(rs) : std::make_unique<exponential_retry_strategy>())
    , _http(std::move(factory), max_conn, [this] (http::request& req) { return authorize(req); }, *_retry_strategy) {
    if (!_creds_provider) {
        throw std::invalid_argument("GCS client needs a credentials provider");
    }
}

shared_ptr<client> client::make(std::string endpoint,
                                shared_ptr<credentials_provider> creds_provider,
                                std::unique_ptr<retry_strategy> rs,
                                std::optional<unsigned> max_conn) {
    auto url = utils::http::parse_simple_url(endpoint);
    auto factory = std::make_unique<utils::http::dns_connection_factory>(url, gcsl);
    return make(std::move(factory), url.host, std::move(creds_provider), std::move(rs), max_conn);
}

shared_ptr<client> client::make(std::unique_ptr<http::experimental::connection_factory> factory,
                                std::string host,
                                shared_ptr<credentials_provider> creds_provider,
                                std::unique_ptr<retry_strategy> rs,
                                std::optional<unsigned> max_conn) {
    return seastar::make_shared<client>(std::move(factory), std::move(host), std::move(creds_provider), std::move(rs), max_conn.value_or(4), private_tag{});
}

future<credentials> client::get_credentials() {
    auto creds = co_await _creds_provider->get_credentials();
    if (!creds) {
        co_await coroutine::return_exception(std::runtime_error(fmt::format("{} has no access token", _creds_provider->get_name())));
    }
    co_return creds;
}

future<> client::authorize(http::request& req) {
    auto creds = co_await get_credentials();
    req._headers["Authorization"] = seastar::format("Bearer {}", creds.access_token);
    for (const auto& [name, value] : creds.headers) {
        req._headers[name] = value;
    }
}

future<object_metadata> client::upload_object(std::string bucket, std::string object_name, body_writer writer, std::string content_type) {
    gcsl.trace("POST upload {}/{}", bucket, object_name);
    auto req = http::request::make("POST", _host, fmt::format("/upload/storage/v1/b/{}/o", utils::http::encode_path_segment(bucket)));
    req.query_parameters.emplace("uploadType", "media");
    req.query_parameters.emplace("name", object_name);
    // No length, the body is sent chunked. The writer is run again for
    // every attempt.
    req.write_body("bin", [writer = std::move(writer)] (output_stream<char>&& out_) -> future<> {
        auto out = std::move(out_);
        std::exception_ptr ex;
        try {
            co_await writer(out);
            co_await out.flush();
        } catch (...) {
            ex = std::current_exception();
        }
        co_await out.close();
        if (ex) {
            auto error = gcs_error::from_exception_ptr(ex);
            if (error.get_error_type() != gcs_error_type::UNKNOWN) {
                co_await coroutine::return_exception_ptr(std::move(ex));
            }
            co_await coroutine::return_exception(gcs_exception(gcs_error(gcs_error_type::REQUEST_BODY, error.get_message(), retryable::no)));
        }
    });
    req._headers["Content-Type"] = content_type;

    object_metadata md;
    co_await _http.make_request(fmt::format("upload of {}/{}", bucket, object_name), std::move(req),
            [&md] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
        auto in = std::move(in_);
        auto body = co_await util::read_entire_stream_contiguous(in);
        md = parse_object_metadata(body);
    }, http::reply::status_type::ok);
    gcsl.debug("Uploaded {}", md);
    co_return md;
}

future<object_metadata> client::compose_object(std::string bucket, std::string destination, compose_request creq, std::optional<std::string> if_generation_match) {
    gcsl.trace("POST compose {}/{} from [{}]", bucket, destination, fmt::join(creq.source_objects, ", "));
    if (creq.source_objects.empty()) {
        throw std::invalid_argument(fmt::format("compose into {} needs at least one source", destination));
    }
    auto req = http::request::make("POST", _host, object_path(bucket, destination) + "/compose");
    if (if_generation_match) {
        req.query_parameters.emplace("ifGenerationMatch", *if_generation_match);
    }
    auto body = dump_compose_request(creq);
    req.write_body("json", body.size(), [body = std::move(body)] (output_stream<char>&& out_) -> future<> {
        auto out = std::move(out_);
        std::exception_ptr ex;
        try {
            co_await out.write(body.data(), body.size());
            co_await out.flush();
        } catch (...) {
            ex = std::current_exception();
        }
        co_await out.close();
        if (ex) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
    });

    object_metadata md;
    co_await _http.make_request(fmt::format("compose of {}/{}", bucket, destination), std::move(req),
            [&md] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
        auto in = std::move(in_);
        auto body = co_await util::read_entire_stream_contiguous(in);
        md = parse_object_metadata(body);
    }, http::reply::status_type::ok);
    gcsl.debug("Composed {}", md);
    co_return md;
}

future<object_metadata> client::get_object_metadata(std::string bucket, std::string object_name) {
    gcsl.trace("GET {}/{}", bucket, object_name);
    auto req = http::request::make("GET", _host, object_path(bucket, object_name));
    object_metadata md;
    co_await _http.make_request(fmt::format("get of {}/{}", bucket, object_name), std::move(req),
            [&md] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
        auto in = std::move(in_);
        auto body = co_await util::read_entire_stream_contiguous(in);
        md = parse_object_metadata(body);
    }, http::reply::status_type::ok);
    co_return md;
}

future<> client::delete_object(std::string bucket, std::string object_name) {
    gcsl.trace("DELETE {}/{}", bucket, object_name);
    auto req = http::request::make("DELETE", _host, object_path(bucket, object_name));
    co_await _http.make_request(fmt::format("delete of {}/{}", bucket, object_name), std::move(req), ignore_reply);
}

future<bucket_metadata> client::get_bucket(std::string bucket) {
    gcsl.trace("GET bucket {}", bucket);
    auto req = http::request::make("GET", _host, fmt::format("/storage/v1/b/{}", utils::http::encode_path_segment(bucket)));
    bucket_metadata md;
    co_await _http.make_request(fmt::format("get of bucket {}", bucket), std::move(req),
            [&md] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
        auto in = std::move(in_);
        auto body = co_await util::read_entire_stream_contiguous(in);
        md = parse_bucket_metadata(body);
    }, http::reply::status_type::ok, _no_retry);
    gcsl.debug("Bucket {}", md);
    co_return md;
}

future<> client::close() {
    co_await _http.close();
}

} // namespace gcs
