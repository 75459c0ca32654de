/**
 * Copyright (c) 2026 The uavlog Authors
 */
#include "net/http_remote_sink.h"

#include "utils/log.h"

#include <curl/curl.h>

namespace uavlog::net {

static std::size_t write_callback(void* contents, std::size_t size, std::size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

static void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpPostResult post_json(const std::string& endpoint, const std::string& body, long timeout_ms) {
    ensure_curl_global_init();

    HttpPostResult result{};
    CURL* curl = curl_easy_init();
    if (!curl) {
        result.error = "Failed to initialize CURL";
        return result;
    }

    std::string response;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    const CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        result.error = curl_easy_strerror(res);
        return result;
    }
    if (result.status < 200 || result.status >= 300) {
        result.error = "HTTP status " + std::to_string(result.status);
        return result;
    }
    result.ok = true;
    return result;
}

HttpRemoteSink::HttpRemoteSink(HttpSinkOptions opt) : _opt(std::move(opt)) {
    ensure_curl_global_init();
    _thread = std::thread([this] { run(); });
}

HttpRemoteSink::~HttpRemoteSink() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _stopping = true;
    }
    _cv.notify_one();
    if (_thread.joinable()) {
        _thread.join();
    }
}

void HttpRemoteSink::submit(nlohmann::ordered_json parse_result) {
    // Labels come straight from the log bytes and may not be valid UTF-8.
    std::string body =
        parse_result.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _queue.push_back(std::move(body));
    }
    _cv.notify_one();
}

void HttpRemoteSink::wait_idle() {
    std::unique_lock<std::mutex> lock(_mutex);
    _idle_cv.wait(lock, [this] { return _queue.empty() && !_busy; });
}

std::size_t HttpRemoteSink::pending() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _queue.size() + (_busy ? 1 : 0);
}

void HttpRemoteSink::run() {
    while (true) {
        std::string body;
        {
            std::unique_lock<std::mutex> lock(_mutex);
            _cv.wait(lock, [this] { return _stopping || !_queue.empty(); });
            if (_queue.empty()) {
                return;
            }
            body = std::move(_queue.front());
            _queue.pop_front();
            _busy = true;
        }
        send(body);
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _busy = false;
        }
        _idle_cv.notify_all();
    }
}

void HttpRemoteSink::send(const std::string& body) {
    const HttpPostResult res = post_json(_opt.endpoint, body, _opt.timeout_ms);
    if (!res.ok) {
        _failed++;
        UAVLOG_LOG_ERROR(
            "Worker failed to send data to backend %s: %s", _opt.endpoint.c_str(),
            res.error.c_str()
        );
        return;
    }
    _sent++;
    UAVLOG_LOG_INFO("Parse result sent to backend (%zu bytes).", body.size());
}

}  // namespace uavlog::net
