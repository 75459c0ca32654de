/**
 * Copyright (c) 2026 The uavlog Authors
 */
#pragma once

#include "net/remote_sink.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace uavlog::net {

struct HttpSinkOptions {
    std::string endpoint = "http://localhost:5000/api/set-flight-data";
    long timeout_ms = 30000;
};

struct HttpPostResult {
    bool ok = false;
    long status = 0;
    std::string error;
};

// Blocking JSON POST; transport failures and non-2xx answers come back as ok == false.
HttpPostResult post_json(const std::string& endpoint, const std::string& body, long timeout_ms);

/**
 * Fire-and-forget POST of each submitted result. Sends run one at a time on a single sender
 * thread in submit order; submit only enqueues. Outcomes are only logged and counted. Queued
 * sends are finished before destruction returns.
 */
class HttpRemoteSink : public RemoteSink {
   public:
    explicit HttpRemoteSink(HttpSinkOptions opt);
    ~HttpRemoteSink() override;

    HttpRemoteSink(const HttpRemoteSink&) = delete;
    HttpRemoteSink& operator=(const HttpRemoteSink&) = delete;

    void submit(nlohmann::ordered_json parse_result) override;

    // Blocks until every submitted send has finished.
    void wait_idle();

    std::size_t sent() const { return _sent.load(); }
    std::size_t failed() const { return _failed.load(); }
    // Submitted sends not yet finished, including the one in flight.
    std::size_t pending() const;

   private:
    void run();
    void send(const std::string& body);

    HttpSinkOptions _opt;
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::condition_variable _idle_cv;
    std::deque<std::string> _queue;
    bool _busy = false;
    bool _stopping = false;
    std::atomic<std::size_t> _sent{0};
    std::atomic<std::size_t> _failed{0};
    std::thread _thread;
};

}  // namespace uavlog::net
