/**
 * Copyright (c) 2026 The uavlog Authors
 */
#pragma once

#include "net/remote_sink.h"
#include "worker/incremental_parser.h"

#include <memory>
#include <optional>
#include <string>

namespace uavlog::worker {

inline constexpr const char* kActionParse = "parse";
inline constexpr const char* kActionLoadType = "loadType";

struct WorkerMessage {
    std::string action;
    // parse
    LogBuffer file;
    bool is_tlog = false;
    bool is_dji = false;
    // loadType; anything from the first '[' on is ignored
    std::optional<std::string> type;

    static WorkerMessage Parse(LogBuffer file, bool is_tlog = false, bool is_dji = false);
    static WorkerMessage LoadType(std::string type);
};

enum class WorkerState {
    Idle,
    Bound,
};

struct WorkerOptions {
    bool debug = false;
};

/**
 * Message-driven parse session owner. A parse request replaces the bound session; loadType is
 * forwarded to the bound parser and ignored while Idle. DataFlash buffers go to both the
 * universal decoder, whose result is handed to the remote sink without waiting, and the
 * legacy per-type parser feeding the UI channel.
 */
class Worker {
   public:
    Worker(ParserFactories factories, UiChannel& ui, net::RemoteSink* remote, WorkerOptions opt = {});

    // nullptr stands for a null message.
    void handle(const WorkerMessage* message);

    WorkerState state() const { return _session ? WorkerState::Bound : WorkerState::Idle; }
    std::optional<ParserFamily> bound_family() const;

   private:
    struct ParserSession {
        ParserFamily family = ParserFamily::DataFlash;
        LogBuffer buffer;
        std::unique_ptr<IncrementalParser> parser;
    };

    void on_parse(const WorkerMessage& message);
    void on_load_type(const WorkerMessage& message);
    void run_universal_parser(const LogBuffer& buffer);
    void bind_session(ParserFamily family, const LogBuffer& buffer);

    ParserFactories _factories;
    UiChannel& _ui;
    net::RemoteSink* _remote = nullptr;
    WorkerOptions _opt;
    std::unique_ptr<ParserSession> _session;
};

}  // namespace uavlog::worker
