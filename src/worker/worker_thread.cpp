/**
 * Copyright (c) 2026 The uavlog Authors
 */
#include "worker/worker_thread.h"

#include "utils/log.h"

#include <stdexcept>

namespace uavlog::worker {

WorkerThread::WorkerThread(std::unique_ptr<Worker> worker) : _worker(std::move(worker)) {
    if (!_worker) {
        throw std::invalid_argument(std::string("WorkerThread requires a worker"));
    }
    _thread = std::thread([this] { run(); });
}

WorkerThread::~WorkerThread() {
    stop();
}

void WorkerThread::post(std::optional<WorkerMessage> message) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_stopping) {
            UAVLOG_LOG_INFO("Worker stopped, message dropped.");
            return;
        }
        _queue.push_back(std::move(message));
    }
    _cv.notify_one();
}

void WorkerThread::stop() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _stopping = true;
    }
    _cv.notify_one();
    if (_thread.joinable()) {
        _thread.join();
    }
}

void WorkerThread::run() {
    while (true) {
        std::optional<WorkerMessage> message;
        {
            std::unique_lock<std::mutex> lock(_mutex);
            _cv.wait(lock, [this] { return _stopping || !_queue.empty(); });
            if (_queue.empty()) {
                return;
            }
            message = std::move(_queue.front());
            _queue.pop_front();
        }
        _worker->handle(message.has_value() ? &*message : nullptr);
    }
}

}  // namespace uavlog::worker
