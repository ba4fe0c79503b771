/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#define BOOST_TEST_MODULE gcs_client_utils

#include <boost/test/unit_test.hpp>
#include "utils/gcs/utils/client_utils.hh"
#include "utils/http.hh"

BOOST_AUTO_TEST_CASE(test_compose_request_json) {
    gcs::compose_request req{"application/octet-stream", {"work/a.rcf", "work/a.rcf.part"}};
    auto parsed = gcs::parse_compose_request(gcs::dump_compose_request(req));
    BOOST_REQUIRE_EQUAL(parsed.content_type, req.content_type);
    BOOST_REQUIRE(parsed.source_objects == req.source_objects);
}

BOOST_AUTO_TEST_CASE(test_object_metadata_json) {
    // GCS sends 64-bit numbers as strings
    auto md = gcs::parse_object_metadata(R"({"kind":"storage#object","bucket":"b","name":"pub/x.rcf","size":"12345678901",
                                             "generation":"1700000000000000","componentCount":2,"contentType":"application/octet-stream"})");
    BOOST_REQUIRE_EQUAL(md.bucket, "b");
    BOOST_REQUIRE_EQUAL(md.name, "pub/x.rcf");
    BOOST_REQUIRE_EQUAL(md.size, 12345678901ull);
    BOOST_REQUIRE_EQUAL(md.component_count, 2u);
    BOOST_REQUIRE_EQUAL(md.generation, "1700000000000000");

    // uploaded objects come without a component count
    md = gcs::parse_object_metadata(R"({"bucket":"b","name":"work/x.rcf","size":"7","generation":"3"})");
    BOOST_REQUIRE_EQUAL(md.component_count, 1u);
    BOOST_REQUIRE_EQUAL(md.size, 7u);

    BOOST_REQUIRE_THROW(gcs::parse_object_metadata("not json"), std::runtime_error);
    BOOST_REQUIRE_THROW(gcs::parse_object_metadata(R"({"bucket":"b"})"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_bucket_metadata_json) {
    auto md = gcs::parse_bucket_metadata(R"({"kind":"storage#bucket","id":"logs","name":"logs","location":"EU","storageClass":"NEARLINE"})");
    BOOST_REQUIRE_EQUAL(md.name, "logs");
    BOOST_REQUIRE_EQUAL(md.location, "EU");
    BOOST_REQUIRE_EQUAL(md.storage_class, "NEARLINE");
}

BOOST_AUTO_TEST_CASE(test_error_envelope) {
    BOOST_REQUIRE_EQUAL(gcs::parse_error_message(gcs::dump_error(403, "denied")).value_or(""), "denied");
    BOOST_REQUIRE(!gcs::parse_error_message("<html>Bad Gateway</html>"));
    BOOST_REQUIRE(!gcs::parse_error_message(R"({"error":"flat"})"));
    BOOST_REQUIRE(!gcs::parse_error_message(""));
}

BOOST_AUTO_TEST_CASE(test_path_segment_encoding) {
    BOOST_REQUIRE_EQUAL(utils::http::encode_path_segment("work/dir/file.rcf.part"), "work%2Fdir%2Ffile.rcf.part");
    BOOST_REQUIRE_EQUAL(utils::http::encode_path_segment("a b"), "a%20b");
}

BOOST_AUTO_TEST_CASE(test_parse_simple_url) {
    auto url = utils::http::parse_simple_url("https://storage.googleapis.com");
    BOOST_REQUIRE_EQUAL(url.host, "storage.googleapis.com");
    BOOST_REQUIRE_EQUAL(url.port, 443);
    BOOST_REQUIRE(url.is_https());

    url = utils::http::parse_simple_url("http://127.0.0.1:4443");
    BOOST_REQUIRE_EQUAL(url.host, "127.0.0.1");
    BOOST_REQUIRE_EQUAL(url.port, 4443);
    BOOST_REQUIRE(!url.is_https());

    BOOST_REQUIRE_THROW(utils::http::parse_simple_url("storage.googleapis.com"), std::invalid_argument);
}
