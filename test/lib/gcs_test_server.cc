/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <limits>
#include <random>
#include <zlib.h>
#include <seastar/core/coroutine.hh>
#include <seastar/http/url.hh>
#include "test/lib/gcs_test_server.hh"
#include "test/lib/log.hh"

using namespace seastar;

namespace tests {

class gcs_test_server::handler : public httpd::handler_base {
    gcs_test_server& _server;

public:
    explicit handler(gcs_test_server& server) : _server(server) {}

    future<std::unique_ptr<http::reply>> handle(const sstring& path, std::unique_ptr<http::request> req, std::unique_ptr<http::reply> rep) override {
        _server.handle_request(path, *req, *rep);
        return make_ready_future<std::unique_ptr<http::reply>>(std::move(rep));
    }
};

gcs_test_server::gcs_test_server(std::string bucket)
    : _bucket(std::move(bucket))
    , _handler(std::make_unique<handler>(*this)) {
}

gcs_test_server::~gcs_test_server() = default;

future<> gcs_test_server::start() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<uint16_t> ports(std::numeric_limits<int16_t>::max(), std::numeric_limits<uint16_t>::max());
    std::uniform_int_distribution<int> octet(1, 254);
    auto address = fmt::format("127.{}.{}.{}", octet(gen), octet(gen), octet(gen));
    return start(std::move(address), ports(gen));
}

future<> gcs_test_server::start(std::string address, uint16_t port) {
    _address = std::move(address);
    _port = port;
    testlog.debug("Starting fake GCS on {}:{}", _address, _port);
    co_await _http_server.start("gcs_test_server");
    co_await _http_server.server().invoke_on_all([this] (httpd::http_server& server) {
        server._routes.add_default_handler(_handler.get());
        return make_ready_future<>();
    });
    std::exception_ptr ex;
    try {
        co_await _http_server.listen(socket_address{net::inet_address(_address), _port});
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        co_await stop();
        co_await coroutine::return_exception(std::runtime_error(seastar::format("Failed to start fake GCS on {}:{}: {}", _address, _port, ex)));
    }
}

future<> gcs_test_server::stop() {
    co_await _http_server.server().stop();
    co_await _http_server.stop();
}

std::string gcs_test_server::endpoint() const {
    return fmt::format("http://{}:{}", _address, _port);
}

size_t gcs_test_server::count(operation op) const {
    return std::ranges::count_if(_requests, [op] (const request_record& r) { return r.op == op; });
}

size_t gcs_test_server::count(operation op, std::string_view object) const {
    return std::ranges::count_if(_requests, [op, object] (const request_record& r) { return r.op == op && r.object == object; });
}

std::optional<std::string> gcs_test_server::get_object(const std::string& name) const {
    auto it = _objects.find(name);
    if (it == _objects.end()) {
        return std::nullopt;
    }
    return it->second.data;
}

std::optional<uint64_t> gcs_test_server::generation_of(const std::string& name) const {
    auto it = _objects.find(name);
    if (it == _objects.end()) {
        return std::nullopt;
    }
    return it->second.generation;
}

std::vector<std::string> gcs_test_server::list(std::string_view prefix) const {
    std::vector<std::string> ret;
    for (const auto& [name, _] : _objects) {
        if (name.starts_with(prefix)) {
            ret.push_back(name);
        }
    }
    return ret;
}

void gcs_test_server::store(std::string name, std::string data, unsigned component_count) {
    _objects[std::move(name)] = stored_object{std::move(data), _generation++, component_count};
}

gcs::object_metadata gcs_test_server::metadata_of(const std::string& name) const {
    const auto& obj = _objects.at(name);
    const auto& data = obj.data;
    gcs::object_metadata md;
    md.bucket = _bucket;
    md.name = name;
    md.content_type = std::string(gcs::octet_stream_content_type);
    md.generation = std::to_string(obj.generation);
    md.crc32c = fmt::format("{:08x}", ::crc32(0, reinterpret_cast<const Bytef*>(data.data()), uInt(data.size())));
    md.size = data.size();
    md.component_count = obj.component_count;
    return md;
}

static std::vector<std::string> split_path(std::string_view path) {
    std::vector<std::string> segments;
    while (!path.empty()) {
        auto slash = path.find('/');
        auto segment = path.substr(0, slash);
        if (!segment.empty()) {
            sstring decoded;
            if (!http::internal::url_decode(segment, decoded)) {
                throw std::invalid_argument(fmt::format("bad path segment {}", segment));
            }
            segments.emplace_back(decoded);
        }
        if (slash == std::string_view::npos) {
            break;
        }
        path.remove_prefix(slash + 1);
    }
    return segments;
}

void gcs_test_server::handle_request(std::string_view path, const http::request& req, http::reply& rep) {
    request_record rec{operation::unknown, std::string(req._method), {}, http::reply::status_type::ok,
                       std::string(req.get_header("Authorization")), std::string(req.get_header("Content-Type")), req.content.size()};
    std::string bucket;

    auto respond = [&] (http::reply::status_type status, std::string body) {
        rec.status = status;
        rep.set_status(status);
        rep.write_body("json", sstring(body));
        testlog.trace("{} {} -> {}", rec.method, path, int(status));
        _requests.push_back(rec);
    };
    auto respond_error = [&] (http::reply::status_type status, std::string_view message) {
        respond(status, gcs::dump_error(int(status), message));
    };

    std::vector<std::string> seg;
    try {
        seg = split_path(path);
    } catch (const std::invalid_argument& e) {
        respond_error(http::reply::status_type::bad_request, e.what());
        return;
    }
    // upload/storage/v1/b/<bucket>/o
    if (req._method == "POST" && seg.size() == 6 && seg[0] == "upload" && seg[1] == "storage" && seg[3] == "b" && seg[5] == "o") {
        rec.op = operation::upload;
        bucket = seg[4];
        auto name = req.query_parameters.find("name");
        auto type = req.query_parameters.find("uploadType");
        if (name == req.query_parameters.end() || type == req.query_parameters.end() || type->second != "media") {
            respond_error(http::reply::status_type::bad_request, "media upload needs uploadType=media and name");
            return;
        }
        rec.object = name->second;
    // storage/v1/b/<bucket>/o/<object>/compose
    } else if (req._method == "POST" && seg.size() == 7 && seg[0] == "storage" && seg[2] == "b" && seg[4] == "o" && seg[6] == "compose") {
        rec.op = operation::compose;
        bucket = seg[3];
        rec.object = seg[5];
    } else if (req._method == "GET" && seg.size() == 6 && seg[0] == "storage" && seg[2] == "b" && seg[4] == "o") {
        rec.op = operation::get_object;
        bucket = seg[3];
        rec.object = seg[5];
    } else if (req._method == "DELETE" && seg.size() == 6 && seg[0] == "storage" && seg[2] == "b" && seg[4] == "o") {
        rec.op = operation::remove;
        bucket = seg[3];
        rec.object = seg[5];
    } else if (req._method == "GET" && seg.size() == 4 && seg[0] == "storage" && seg[2] == "b") {
        rec.op = operation::get_bucket;
        bucket = seg[3];
    } else {
        respond_error(http::reply::status_type::bad_request, fmt::format("unsupported request {} {}", req._method, path));
        return;
    }

    if (_required_token && rec.authorization != "Bearer " + *_required_token) {
        respond_error(http::reply::status_type::unauthorized, "Invalid Credentials");
        return;
    }

    std::optional<http::reply::status_type> injected;
    bool apply = true;
    for (auto& f : _failures) {
        if (f.op == rec.op && f.count > 0 && rec.object.starts_with(f.object_prefix)) {
            --f.count;
            injected = f.status;
            apply = f.apply_first;
            break;
        }
    }

    auto finish = [&] (http::reply::status_type status, std::string body) {
        if (injected) {
            respond_error(*injected, "injected failure");
        } else {
            respond(status, std::move(body));
        }
    };

    if (!apply) {
        finish(http::reply::status_type::ok, "");
        return;
    }

    if (bucket != _bucket) {
        respond_error(http::reply::status_type::not_found, "The specified bucket does not exist.");
        return;
    }

    switch (rec.op) {
    case operation::upload:
        store(rec.object, std::string(req.content));
        finish(http::reply::status_type::ok, gcs::dump_object_metadata(metadata_of(rec.object)));
        return;
    case operation::compose: {
        gcs::compose_request creq;
        try {
            creq = gcs::parse_compose_request(std::string_view(req.content));
        } catch (const std::exception& e) {
            respond_error(http::reply::status_type::bad_request, e.what());
            return;
        }
        // "0" means the destination must not exist yet
        if (auto match = req.query_parameters.find("ifGenerationMatch"); match != req.query_parameters.end()) {
            auto current = generation_of(rec.object).value_or(0);
            if (match->second != std::to_string(current)) {
                respond_error(http::reply::status_type(412), "At least one of the pre-conditions you specified did not hold.");
                return;
            }
        }
        std::string data;
        unsigned components = 0;
        for (const auto& source : creq.source_objects) {
            auto it = _objects.find(source);
            if (it == _objects.end()) {
                respond_error(http::reply::status_type::not_found, fmt::format("No such object: {}/{}", _bucket, source));
                return;
            }
            data += it->second.data;
            components += it->second.component_count;
        }
        store(rec.object, std::move(data), components);
        finish(http::reply::status_type::ok, gcs::dump_object_metadata(metadata_of(rec.object)));
        return;
    }
    case operation::get_object:
        if (!_objects.contains(rec.object)) {
            respond_error(http::reply::status_type::not_found, fmt::format("No such object: {}/{}", _bucket, rec.object));
            return;
        }
        finish(http::reply::status_type::ok, gcs::dump_object_metadata(metadata_of(rec.object)));
        return;
    case operation::remove:
        if (!_objects.erase(rec.object)) {
            respond_error(http::reply::status_type::not_found, fmt::format("No such object: {}/{}", _bucket, rec.object));
            return;
        }
        finish(http::reply::status_type::no_content, "");
        return;
    case operation::get_bucket:
        finish(http::reply::status_type::ok, gcs::dump_bucket_metadata(gcs::bucket_metadata{
            .id = _bucket, .name = _bucket, .location = "US", .storage_class = "STANDARD"}));
        return;
    case operation::unknown:
        break;
    }
    respond_error(http::reply::status_type::bad_request, "unsupported operation");
}

} // namespace tests
