/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <iostream>
#include <seastar/core/app-template.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/util/short_streams.hh>
#include "filesinks/file_flusher.hh"
#include "filesinks/gcs_file_manager_factory.hh"
#include "filesinks/record_decoder.hh"
#include "filesinks/sink_config.hh"
#include "utils/gcs/credentials_providers/credentials_provider_chain.hh"
#include "utils/gcs/credentials_providers/environment_credentials_provider.hh"
#include "utils/gcs/credentials_providers/static_credentials_provider.hh"
#include "utils/log.hh"

using namespace seastar;

static logging::logger plog("gcsink_publish");

// Publishes every line of `input` as one record. The flusher syncs and rolls
// files according to the configured file strategy; its time based part is
// checked after every record.
static future<> publish_lines(filesinks::file_flusher& flusher, std::string input) {
    auto f = co_await open_file_dma(input, open_flags::ro);
    auto in = make_file_input_stream(std::move(f));
    std::exception_ptr ex;
    try {
        std::string line;
        while (true) {
            auto buf = co_await in.read();
            if (buf.empty()) {
                break;
            }
            std::string_view data(buf.get(), buf.size());
            size_t nl;
            while ((nl = data.find('\n')) != std::string_view::npos) {
                line.append(data.substr(0, nl));
                co_await flusher.process(std::exchange(line, {}));
                co_await flusher.heartbeat();
                data.remove_prefix(nl + 1);
            }
            line.append(data);
        }
        if (!line.empty()) {
            co_await flusher.process(std::move(line));
        }
    } catch (...) {
        ex = std::current_exception();
    }
    co_await in.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
}

// Prints the records of a locally stored container, one per line
static future<> dump_container(std::string path) {
    auto f = co_await open_file_dma(path, open_flags::ro);
    auto in = make_file_input_stream(std::move(f));
    auto data = co_await util::read_entire_stream_contiguous(in);
    co_await in.close();

    filesinks::record_decoder decoder(std::string_view(data.data(), data.size()));
    std::cerr << fmt::format("schema: {}\n", decoder.schema());
    for (auto& r : decoder.read_all()) {
        std::cout << r << '\n';
    }
    std::cerr << fmt::format("{} blocks\n", decoder.blocks_read());
}

int main(int argc, char** argv) {
    namespace bpo = boost::program_options;
    app_template app;
    app.add_options()
        ("config", bpo::value<sstring>()->default_value("gcsink.yaml"), "sink configuration file")
        ("input", bpo::value<sstring>(), "file with one record per line to publish")
        ("token", bpo::value<sstring>(), "bearer token, used when GCS_OAUTH_ACCESS_TOKEN is not set")
        ("verify-only", "check the configuration against the bucket and exit")
        ("dump", bpo::value<sstring>(), "print the records of a downloaded container and exit")
    ;

    return app.run(argc, argv, [&app] () -> future<int> {
        auto& opts = app.configuration();
        if (opts.contains("dump")) {
            co_await dump_container(opts["dump"].as<sstring>());
            co_return 0;
        }

        auto cfg = filesinks::load_sink_config(std::filesystem::path(std::string(opts["config"].as<sstring>())));
        auto chain = seastar::make_shared<gcs::credentials_provider_chain>();
        chain->add_credentials_provider(std::make_unique<gcs::environment_credentials_provider>());
        if (opts.contains("token")) {
            chain->add_credentials_provider(std::make_unique<gcs::static_credentials_provider>(gcs::credentials{opts["token"].as<sstring>(), {}}));
        }

        auto factory = filesinks::gcs_file_manager_factory::make(std::move(cfg), std::move(chain));
        int ret = 0;
        std::exception_ptr ex;
        try {
            co_await factory.verify_file_system_configuration();
            if (!opts.contains("verify-only")) {
                if (!opts.contains("input")) {
                    throw std::invalid_argument("--input is required unless --verify-only is given");
                }
                auto manager = factory.create();
                filesinks::file_flusher flusher(*manager);
                std::exception_ptr publish_ex;
                try {
                    co_await publish_lines(flusher, opts["input"].as<sstring>());
                } catch (...) {
                    publish_ex = std::current_exception();
                }
                co_await flusher.close();
                if (publish_ex) {
                    std::rethrow_exception(publish_ex);
                }
                const auto& st = flusher.get_stats();
                plog.info("Published {} files with {} records, {} records dropped, {} objects left behind",
                          st.files_published, st.records_written, st.records_dropped, st.cleanup_failures);
                ret = st.records_dropped ? 1 : 0;
            }
        } catch (...) {
            ex = std::current_exception();
        }
        co_await factory.close();
        if (ex) {
            plog.error("Error running: {}", ex);
            ret = 2;
        }
        co_return ret;
    });
}
