/**
 * Copyright (c) 2026 The uavlog Authors
 */
#pragma once

#include "worker/worker.h"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace uavlog::worker {

// Runs a Worker on its own thread, one queued message at a time.
class WorkerThread {
   public:
    explicit WorkerThread(std::unique_ptr<Worker> worker);
    ~WorkerThread();

    WorkerThread(const WorkerThread&) = delete;
    WorkerThread& operator=(const WorkerThread&) = delete;

    // nullopt is delivered to the worker as a null message.
    void post(std::optional<WorkerMessage> message);

    // Handles everything already queued, then joins. Further posts are dropped.
    void stop();

    // Only meaningful once stop() has returned.
    const Worker& worker() const { return *_worker; }

   private:
    void run();

    std::unique_ptr<Worker> _worker;
    std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<std::optional<WorkerMessage>> _queue;
    bool _stopping = false;
    std::thread _thread;
};

}  // namespace uavlog::worker
