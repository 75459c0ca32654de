/**
 * Copyright (c) 2026 The uavlog Authors
 */
#include "app_config.h"
#include "net/http_remote_sink.h"
#include "utils/fs_utils.h"
#include "utils/log.h"
#include "worker/legacy_dataflash_parser.h"
#include "worker/worker.h"
#include "worker/worker_thread.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

struct Settings {
    std::optional<fs::path> config_path;
    std::optional<std::string> endpoint;
    bool no_send = false;
    bool force_tlog = false;
    bool force_dji = false;
    bool debug = false;
    std::vector<std::string> load_types;
};

static void print_usage() {
    UAVLOG_LOG_INFO(
        "Usage:\n" \
        "    uavlog_parser <file-or-dir> [--config <path>] [--endpoint <url>] [--no-send] [--tlog] [--dji] [--load <TYPE>]... [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be a file or directory\n" \
        "    --config      JSON config file (endpoint, timeoutMs, sendRemote, legacyPreloadTypes, outputDir, debug)\n" \
        "    --endpoint    URL the parse result is POSTed to\n" \
        "    --no-send     skips the POST of the parse result\n" \
        "    --tlog        treats inputs as MAVLink telemetry logs\n" \
        "    --dji         treats inputs as DJI flight records\n" \
        "    --load        requests one more message type after the parse (repeatable)\n" \
        "    --debug       enables extra logging\n"
    );
}

static std::string lower_extension(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

// Writes each parse result as <dir>/<base>.json.
class JsonOutputSink : public uavlog::net::RemoteSink {
   public:
    JsonOutputSink(fs::path dir, std::string base) : _dir(std::move(dir)), _base(std::move(base)) {}

    void submit(nlohmann::ordered_json parse_result) override {
        const fs::path json_path = _dir / (_base + std::string(".json"));
        try {
            uavlog::fs_utils::write_text_file(
                json_path,
                parse_result.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace)
            );
            UAVLOG_LOG_INFO("Wrote: %s", json_path.string().c_str());
        } catch (const std::exception& e) {
            UAVLOG_LOG_ERROR("Failed to write %s (%s)", json_path.string().c_str(), e.what());
        }
    }

   private:
    fs::path _dir;
    std::string _base;
};

class TeeSink : public uavlog::net::RemoteSink {
   public:
    explicit TeeSink(std::vector<uavlog::net::RemoteSink*> sinks) : _sinks(std::move(sinks)) {}

    void submit(nlohmann::ordered_json parse_result) override {
        for (std::size_t i = 0; i < _sinks.size(); i++) {
            if (i + 1 == _sinks.size()) {
                _sinks[i]->submit(std::move(parse_result));
            } else {
                _sinks[i]->submit(parse_result);
            }
        }
    }

   private:
    std::vector<uavlog::net::RemoteSink*> _sinks;
};

// Stands in for the interactive view: one summary line per posted message.
class LoggingUiChannel : public uavlog::worker::UiChannel {
   public:
    explicit LoggingUiChannel(bool debug) : _debug(debug) {}

    void post(nlohmann::ordered_json message) override {
        if (message.contains("availableMessages")) {
            UAVLOG_LOG_INFO("UI: %zu message types available", message["availableMessages"].size());
        } else if (message.contains("messageType")) {
            const auto& list = message["messageList"];
            std::size_t rows = 0;
            if (list.is_object() && !list.empty()) {
                rows = list.begin()->size();
            }
            UAVLOG_LOG_INFO(
                "UI: %s loaded (%zu fields, %zu rows)",
                message["messageType"].get<std::string>().c_str(), list.size(), rows
            );
        } else if (message.contains("messagesDoneLoading")) {
            UAVLOG_LOG_INFO("UI: messages done loading");
        }
        if (_debug) {
            UAVLOG_LOG_INFO(
                "%s",
                message.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace)
                    .c_str()
            );
        }
    }

   private:
    bool _debug = false;
};

static void process_file(
    const fs::path& path,
    const fs::path& out_json_dir,
    const Settings& settings,
    const uavlog::AppConfig& config,
    uavlog::net::RemoteSink* remote
) {
    const std::string base = path.stem().string();
    try {
        auto bytes = uavlog::fs_utils::read_file(path);
        if (bytes.empty()) {
            UAVLOG_LOG_INFO("Skipped: %s (empty file)", path.string().c_str());
            return;
        }
        const auto buffer =
            std::make_shared<const std::vector<std::uint8_t>>(std::move(bytes));

        const std::string ext = lower_extension(path);
        const bool is_tlog = settings.force_tlog || (!settings.force_dji && ext == ".tlog");
        const bool is_dji = !is_tlog && (settings.force_dji || ext == ".txt");

        LoggingUiChannel ui(config.debug);
        JsonOutputSink json_sink(out_json_dir, base);
        std::vector<uavlog::net::RemoteSink*> sinks{&json_sink};
        if (remote) {
            sinks.push_back(remote);
        }
        TeeSink tee(std::move(sinks));

        uavlog::worker::ParserFactories factories{};
        const auto preload = config.legacy_preload_types;
        factories.dataflash = [preload](uavlog::worker::UiChannel& channel) {
            return std::make_unique<uavlog::worker::LegacyDataflashParser>(channel, preload);
        };

        uavlog::worker::WorkerOptions wopt{};
        wopt.debug = config.debug;
        uavlog::worker::WorkerThread thread(
            std::make_unique<uavlog::worker::Worker>(std::move(factories), ui, &tee, wopt)
        );

        UAVLOG_LOG_INFO("Parsing: %s", path.string().c_str());
        thread.post(uavlog::worker::WorkerMessage::Parse(buffer, is_tlog, is_dji));
        for (const auto& type : settings.load_types) {
            thread.post(uavlog::worker::WorkerMessage::LoadType(type));
        }
        thread.stop();
    } catch (const std::exception& e) {
        UAVLOG_LOG_ERROR("Failed: %s (%s)", path.string().c_str(), e.what());
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view first_arg = argv[1];
    if (!first_arg.empty() && first_arg[0] == '-') {
        UAVLOG_LOG_ERROR("First argument must be a file or folder.");
        print_usage();
        return 2;
    }
    const fs::path input = fs::path(std::string(first_arg));
    Settings settings;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--no-send") {
            settings.no_send = true;
            continue;
        }
        if (arg == "--tlog") {
            settings.force_tlog = true;
            continue;
        }
        if (arg == "--dji") {
            settings.force_dji = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "--config" || arg == "--endpoint" || arg == "--load") {
            if (i + 1 >= argc) {
                UAVLOG_LOG_ERROR("Missing value for %s", std::string(arg).c_str());
                return 2;
            }
            const std::string value = argv[++i];
            if (arg == "--config") {
                settings.config_path = fs::path(value);
            } else if (arg == "--endpoint") {
                settings.endpoint = value;
            } else {
                settings.load_types.push_back(value);
            }
            continue;
        }
        UAVLOG_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }

    if (!fs::exists(input)) {
        UAVLOG_LOG_ERROR("Input does not exist: %s", input.string().c_str());
        return 2;
    }

    uavlog::AppConfig config{};
    if (settings.config_path.has_value()) {
        try {
            config = uavlog::load_app_config(*settings.config_path);
        } catch (const std::exception& e) {
            UAVLOG_LOG_ERROR("%s", e.what());
            return 2;
        }
    }
    if (settings.endpoint.has_value()) {
        config.endpoint = *settings.endpoint;
    }
    if (settings.no_send) {
        config.send_remote = false;
    }
    if (settings.debug) {
        config.debug = true;
    }

    const fs::path out_root = config.output_dir.has_value()
                                  ? *config.output_dir
                                  : uavlog::fs_utils::executable_dir() / "output";
    const fs::path out_json_dir = out_root / "json";
    uavlog::fs_utils::ensure_dir(out_json_dir);

    std::unique_ptr<uavlog::net::HttpRemoteSink> remote;
    if (config.send_remote) {
        uavlog::net::HttpSinkOptions hopt{};
        hopt.endpoint = config.endpoint;
        hopt.timeout_ms = config.timeout_ms;
        remote = std::make_unique<uavlog::net::HttpRemoteSink>(std::move(hopt));
    }

    if (fs::is_directory(input)) {
        const auto inputs = uavlog::fs_utils::collect_inputs(input, settings.force_dji);
        for (const auto& p : inputs) {
            process_file(p, out_json_dir, settings, config, remote.get());
        }
    } else {
        process_file(input, out_json_dir, settings, config, remote.get());
    }

    if (remote) {
        remote->wait_idle();
    }
    return 0;
}
