/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "client_utils.hh"
#include <memory>
#include <stdexcept>
#include <json/json.h>
#include <boost/lexical_cast.hpp>
#include "utils/log.hh"

namespace gcs {

extern logging::logger gcsl;

static std::string to_string(const Json::Value& value) {
    Json::StreamWriterBuilder wbuilder;
    wbuilder.settings_["indentation"] = "";
    return Json::writeString(wbuilder, value);
}

static Json::Value to_json_value(std::string_view raw, std::string_view what) {
    Json::Value root;
    Json::CharReaderBuilder rbuilder;
    std::unique_ptr<Json::CharReader> reader(rbuilder.newCharReader());
    std::string errors;
    if (!reader->parse(raw.data(), raw.data() + raw.size(), &root, &errors)) {
        gcsl.warn("cannot parse {}: {}", what, errors);
        throw std::runtime_error(fmt::format("cannot parse {}", what));
    }
    if (!root.isObject()) {
        throw std::runtime_error(fmt::format("{} is not a JSON object", what));
    }
    return root;
}

// GCS encodes 64-bit integers as strings
static uint64_t as_uint64(const Json::Value& value) {
    if (value.isNull()) {
        return 0;
    }
    if (value.isString()) {
        return boost::lexical_cast<uint64_t>(value.asString());
    }
    return value.asUInt64();
}

std::string dump_compose_request(const compose_request& req) {
    Json::Value root(Json::objectValue);
    root["destination"]["contentType"] = req.content_type;
    auto& sources = root["sourceObjects"] = Json::Value(Json::arrayValue);
    for (const auto& name : req.source_objects) {
        Json::Value source(Json::objectValue);
        source["name"] = name;
        sources.append(std::move(source));
    }
    return to_string(root);
}

compose_request parse_compose_request(std::string_view body) {
    auto root = to_json_value(body, "compose request");
    compose_request req;
    req.content_type = root["destination"]["contentType"].asString();
    const auto& sources = root["sourceObjects"];
    if (!sources.isArray()) {
        throw std::runtime_error("'sourceObjects' missing in compose request");
    }
    for (const auto& source : sources) {
        req.source_objects.emplace_back(source["name"].asString());
    }
    return req;
}

std::string dump_object_metadata(const object_metadata& md) {
    Json::Value root(Json::objectValue);
    root["kind"] = "storage#object";
    root["bucket"] = md.bucket;
    root["name"] = md.name;
    root["contentType"] = md.content_type;
    root["generation"] = md.generation;
    root["crc32c"] = md.crc32c;
    root["size"] = std::to_string(md.size);
    root["componentCount"] = md.component_count;
    return to_string(root);
}

object_metadata parse_object_metadata(std::string_view body) {
    auto root = to_json_value(body, "object metadata");
    object_metadata md;
    md.bucket = root["bucket"].asString();
    md.name = root["name"].asString();
    if (md.name.empty()) {
        throw std::runtime_error("'name' missing in object metadata");
    }
    md.content_type = root["contentType"].asString();
    md.generation = root["generation"].asString();
    md.crc32c = root["crc32c"].asString();
    md.size = as_uint64(root["size"]);
    md.component_count = root.get("componentCount", 1).asUInt();
    return md;
}

std::string dump_bucket_metadata(const bucket_metadata& md) {
    Json::Value root(Json::objectValue);
    root["kind"] = "storage#bucket";
    root["id"] = md.id;
    root["name"] = md.name;
    root["location"] = md.location;
    root["storageClass"] = md.storage_class;
    return to_string(root);
}

bucket_metadata parse_bucket_metadata(std::string_view body) {
    auto root = to_json_value(body, "bucket metadata");
    bucket_metadata md;
    md.id = root["id"].asString();
    md.name = root["name"].asString();
    if (md.name.empty()) {
        throw std::runtime_error("'name' missing in bucket metadata");
    }
    md.location = root["location"].asString();
    md.storage_class = root["storageClass"].asString();
    return md;
}

std::optional<std::string> parse_error_message(std::string_view body) {
    Json::Value root;
    Json::CharReaderBuilder rbuilder;
    std::unique_ptr<Json::CharReader> reader(rbuilder.newCharReader());
    if (body.empty() || !reader->parse(body.data(), body.data() + body.size(), &root, nullptr) || !root.isObject()) {
        return std::nullopt;
    }
    const auto& error = root["error"];
    if (!error.isObject() || !error["message"].isString()) {
        return std::nullopt;
    }
    return error["message"].asString();
}

std::string dump_error(int code, std::string_view message) {
    Json::Value root(Json::objectValue);
    root["error"]["code"] = code;
    root["error"]["message"] = std::string(message);
    return to_string(root);
}

} // namespace gcs

auto fmt::formatter<gcs::object_metadata>::format(const gcs::object_metadata& md, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "object{{bucket={}, name={}, size={}, generation={}, components={}, crc32c={}}}",
                          md.bucket, md.name, md.size, md.generation, md.component_count, md.crc32c);
}

auto fmt::formatter<gcs::bucket_metadata>::format(const gcs::bucket_metadata& md, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "bucket{{name={}, location={}, storage_class={}}}", md.name, md.location, md.storage_class);
}
