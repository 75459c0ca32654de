/**
 * Copyright (c) 2026 The uavlog Authors
 */
#include "worker/incremental_parser.h"

namespace uavlog::worker {

const char* parser_family_name(ParserFamily family) {
    switch (family) {
        case ParserFamily::DataFlash:
            return "dataflash";
        case ParserFamily::Tlog:
            return "tlog";
        case ParserFamily::Dji:
            return "dji";
    }
    return "unknown";
}

const ParserFactory& ParserFactories::for_family(ParserFamily family) const {
    switch (family) {
        case ParserFamily::Tlog:
            return tlog;
        case ParserFamily::Dji:
            return dji;
        case ParserFamily::DataFlash:
        default:
            return dataflash;
    }
}

}  // namespace uavlog::worker
