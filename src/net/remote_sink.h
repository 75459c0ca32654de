/**
 * Copyright (c) 2026 The uavlog Authors
 */
#pragma once

#include <nlohmann/json.hpp>

namespace uavlog::net {

// Receives one complete parse result per decoded file. submit() must not block on delivery.
class RemoteSink {
   public:
    virtual ~RemoteSink() = default;
    virtual void submit(nlohmann::ordered_json parse_result) = 0;
};

}  // namespace uavlog::net
