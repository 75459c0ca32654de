/**
 * Copyright (c) 2026 The uavlog Authors
 */
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace uavlog::worker {

// Whole file as received by the worker; shared read-only between the decoders of one parse.
using LogBuffer = std::shared_ptr<const std::vector<std::uint8_t>>;

enum class ParserFamily {
    DataFlash,
    Tlog,
    Dji,
};

const char* parser_family_name(ParserFamily family);

// Outbound channel to the interactive side. Each post is a self-contained message.
class UiChannel {
   public:
    virtual ~UiChannel() = default;
    virtual void post(nlohmann::ordered_json message) = 0;
};

// A parser bound to the worker after a parse request; answers later type-selection requests.
class IncrementalParser {
   public:
    virtual ~IncrementalParser() = default;
    virtual void process_data(const LogBuffer& buffer) = 0;
    virtual void load_type(const std::string& type_name) = 0;
};

using ParserFactory = std::function<std::unique_ptr<IncrementalParser>(UiChannel& ui)>;

// An empty factory means that family is not available in this build.
struct ParserFactories {
    ParserFactory dataflash;
    ParserFactory tlog;
    ParserFactory dji;

    const ParserFactory& for_family(ParserFamily family) const;
};

}  // namespace uavlog::worker
