/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <stdexcept>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/backtrace.hh>
#include "retargeting_sink.hh"
#include "utils/log.hh"

using namespace seastar;

namespace gcs {

extern logging::logger gcsl;

output_stream<char>& retargeting_sink::target() {
    if (!_target) [[unlikely]] {
        throw_with_backtrace<std::logic_error>("write to a detached retargeting sink");
    }
    return *_target;
}

void retargeting_sink::attach(output_stream<char>& out) {
    if (_target) {
        throw std::logic_error("retargeting sink is already attached");
    }
    _target = &out;
}

future<> retargeting_sink::detach() {
    auto& out = target();
    co_await out.flush();
    _target = nullptr;
}

future<> retargeting_sink::put(net::packet data) {
    auto& out = target();
    _bytes_forwarded += data.len();
    return out.write(std::move(data));
}

future<> retargeting_sink::put(std::vector<temporary_buffer<char>> data) {
    for (auto&& buf : data) {
        co_await put(std::move(buf));
    }
}

future<> retargeting_sink::put(temporary_buffer<char> buf) {
    auto& out = target();
    _bytes_forwarded += buf.size();
    co_await out.write(buf.get(), buf.size());
}

future<> retargeting_sink::flush() {
    if (!_target) {
        return make_ready_future<>();
    }
    return _target->flush();
}

future<> retargeting_sink::close() {
    if (_target) {
        gcsl.warn("closing retargeting sink while attached, {} bytes forwarded", _bytes_forwarded);
        _target = nullptr;
    }
    return make_ready_future<>();
}

body_writer retargeted_writer(retargeting_sink& sink, noncopyable_function<future<>()> write) {
    return [&sink, write = std::move(write)] (output_stream<char>& out) -> future<> {
        sink.attach(out);
        std::exception_ptr ex;
        try {
            co_await write();
        } catch (...) {
            ex = std::current_exception();
        }
        if (ex) {
            sink.reset();
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
        co_await sink.detach();
    };
}

} // namespace gcs
