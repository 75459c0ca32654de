/**
 * Copyright (c) 2026 The uavlog Authors
 */
#include "worker/worker.h"

#include "universal_parser.h"
#include "utils/log.h"

#include <stdexcept>

namespace uavlog::worker {

WorkerMessage WorkerMessage::Parse(LogBuffer file, bool is_tlog, bool is_dji) {
    WorkerMessage m{};
    m.action = kActionParse;
    m.file = std::move(file);
    m.is_tlog = is_tlog;
    m.is_dji = is_dji;
    return m;
}

WorkerMessage WorkerMessage::LoadType(std::string type) {
    WorkerMessage m{};
    m.action = kActionLoadType;
    m.type = std::move(type);
    return m;
}

Worker::Worker(ParserFactories factories, UiChannel& ui, net::RemoteSink* remote, WorkerOptions opt)
    : _factories(std::move(factories)), _ui(ui), _remote(remote), _opt(opt) {}

std::optional<ParserFamily> Worker::bound_family() const {
    if (!_session) {
        return std::nullopt;
    }
    return _session->family;
}

void Worker::handle(const WorkerMessage* message) {
    if (!message) {
        UAVLOG_LOG_INFO("Worker received bad file message!");
        return;
    }
    if (message->action.empty()) {
        UAVLOG_LOG_INFO("Worker received message without action, dropping.");
        return;
    }
    if (message->action == kActionParse) {
        on_parse(*message);
        return;
    }
    if (message->action == kActionLoadType) {
        on_load_type(*message);
        return;
    }
    UAVLOG_LOG_INFO("Worker received unknown action '%s', dropping.", message->action.c_str());
}

void Worker::on_parse(const WorkerMessage& message) {
    if (!message.file) {
        UAVLOG_LOG_INFO("Worker received parse message without file, dropping.");
        return;
    }

    ParserFamily family = ParserFamily::DataFlash;
    if (message.is_tlog) {
        family = ParserFamily::Tlog;
    } else if (message.is_dji) {
        family = ParserFamily::Dji;
    }

    if (family == ParserFamily::DataFlash) {
        run_universal_parser(message.file);
    }
    bind_session(family, message.file);
}

void Worker::run_universal_parser(const LogBuffer& buffer) {
    // Must never disturb the legacy UI path, whatever happens here.
    try {
        df::ParserDecodeOptions opt{};
        opt.collect_metadata = false;
        opt.debug = _opt.debug;
        df::DecodeResult result = df::UniversalParser::DecodeLogBytes(*buffer, opt, "worker");
        if (_opt.debug) {
            std::string keys;
            for (const auto& kv : result.tables.items()) {
                if (!keys.empty()) {
                    keys += ", ";
                }
                keys += kv.key();
            }
            UAVLOG_LOG_INFO("Universal parser message types: [%s]", keys.c_str());
        }
        if (_remote) {
            _remote->submit(std::move(result.tables));
        }
    } catch (const std::exception& e) {
        UAVLOG_LOG_ERROR("Universal parser failed: %s", e.what());
    }
}

void Worker::bind_session(ParserFamily family, const LogBuffer& buffer) {
    _session.reset();

    const ParserFactory& factory = _factories.for_family(family);
    if (!factory) {
        UAVLOG_LOG_INFO(
            "No %s parser available, parse request dropped.", parser_family_name(family)
        );
        return;
    }

    auto session = std::make_unique<ParserSession>();
    session->family = family;
    session->buffer = buffer;
    session->parser = factory(_ui);
    if (!session->parser) {
        UAVLOG_LOG_ERROR("%s parser factory returned no parser.", parser_family_name(family));
        return;
    }
    _session = std::move(session);

    try {
        _session->parser->process_data(_session->buffer);
    } catch (const std::exception& e) {
        UAVLOG_LOG_ERROR("%s parser failed: %s", parser_family_name(family), e.what());
    }
}

void Worker::on_load_type(const WorkerMessage& message) {
    if (!_session) {
        UAVLOG_LOG_INFO("Parser not yet initialized, ignoring loadType request.");
        return;
    }
    if (!message.type.has_value()) {
        UAVLOG_LOG_INFO("Worker received loadType message without type, dropping.");
        return;
    }

    const std::string& requested = *message.type;
    const std::string type_name = requested.substr(0, requested.find('['));
    try {
        _session->parser->load_type(type_name);
    } catch (const std::exception& e) {
        UAVLOG_LOG_ERROR("loadType %s failed: %s", type_name.c_str(), e.what());
    }
}

}  // namespace uavlog::worker
