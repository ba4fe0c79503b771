/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <seastar/core/iostream.hh>
#include <seastar/util/noncopyable_function.hh>
#include "utils/gcs/client.hh"

namespace gcs {

// A data sink whose destination is swapped per request. The writer above it
// keeps one data_sink for its whole life, while every upload attaches the
// output stream of its own request body, writes and detaches again.
//
// Neither detaching nor closing this sink closes the attached stream: the
// request owns that.
class retargeting_sink final : public seastar::data_sink_impl {
    seastar::output_stream<char>* _target = nullptr;
    uint64_t _bytes_forwarded = 0;

    seastar::output_stream<char>& target();

public:
    void attach(seastar::output_stream<char>& out);
    // Flushes whatever went to the attached stream, then disconnects
    seastar::future<> detach();
    // Disconnects without flushing, for a request that is being abandoned
    void reset() noexcept { _target = nullptr; }

    bool attached() const noexcept { return _target != nullptr; }
    uint64_t bytes_forwarded() const noexcept { return _bytes_forwarded; }

    virtual seastar::future<> put(seastar::net::packet data) override;
    virtual seastar::future<> put(std::vector<seastar::temporary_buffer<char>> data) override;
    virtual seastar::future<> put(seastar::temporary_buffer<char> buf) override;
    virtual seastar::future<> flush() override;
    virtual seastar::future<> close() override;

    virtual size_t buffer_size() const noexcept override {
        return 128 * 1024;
    }
};

// Makes an upload body out of `write`, which produces its bytes into `sink`.
// Every attempt attaches the attempt's stream, runs `write` and detaches.
// `write` must emit the same bytes each time it is called.
body_writer retargeted_writer(retargeting_sink& sink, seastar::noncopyable_function<seastar::future<>()> write);

} // namespace gcs
