/**
 * Copyright (c) 2026 The uavlog Authors
 */
#include "universal_parser.h"

#include "dataflash/df_columnar.h"
#include "dataflash/df_format_registry.h"
#include "dataflash/df_record_decoder.h"
#include "dataflash/df_sync_scanner.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <chrono>
#include <stdexcept>
#include <string>

namespace uavlog::df {

static nlohmann::ordered_json build_metadata_block(
    const FormatRegistry& registry,
    const DecodeStats& stats,
    std::size_t type_count
) {
    nlohmann::ordered_json meta = nlohmann::ordered_json::object();

    nlohmann::ordered_json formats = nlohmann::ordered_json::array();
    for (const auto& [id, fmt] : registry.formats()) {
        nlohmann::ordered_json f = nlohmann::ordered_json::object();
        f["typeId"] = id;
        f["name"] = fmt.name;
        f["length"] = fmt.declared_length;
        f["format"] = fmt.format_codes;
        f["labels"] = fmt.field_labels;
        if (fmt.format_codes.size() != fmt.field_labels.size()) {
            f["labelMismatch"] = true;
        }
        formats.push_back(std::move(f));
    }
    meta["formats"] = std::move(formats);

    nlohmann::ordered_json counters = nlohmann::ordered_json::object();
    counters["formatRecords"] = registry.format_records_seen();
    counters["records"] = stats.records;
    counters["messageTypes"] = type_count;
    if (stats.truncated_records != 0) {
        counters["truncatedRecords"] = stats.truncated_records;
    }
    if (stats.unknown_type_hits != 0) {
        counters["unknownTypeHits"] = stats.unknown_type_hits;
    }
    if (stats.field_errors != 0) {
        counters["fieldErrors"] = stats.field_errors;
    }
    meta["stats"] = std::move(counters);
    return meta;
}

DecodeResult
UniversalParser::DecodeLogFile(const std::filesystem::path& path, const ParserDecodeOptions& opt) {
    const auto bytes = uavlog::fs_utils::read_file(path);
    if (bytes.empty()) {
        throw std::runtime_error("Log file is empty: " + path.string());
    }
    return DecodeLogBytes(bytes, opt, path.filename().string());
}

DecodeResult UniversalParser::DecodeLogBytes(
    std::span<const std::uint8_t> bytes,
    const ParserDecodeOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    const FormatRegistry registry = FormatRegistry::learn(bytes, opt.debug);
    const auto t1 = std::chrono::steady_clock::now();

    DecodeStats stats{};
    ColumnarMaterializer materializer;
    for (const std::size_t offset : SyncScanner(bytes)) {
        const std::uint8_t type_id = bytes[offset + 2];
        const MessageFormatDescriptor* fmt = registry.find(type_id);
        if (!fmt) {
            stats.unknown_type_hits++;
            continue;
        }
        auto record = decode_record(*fmt, bytes, offset, &stats);
        if (record.has_value()) {
            materializer.append(std::move(*record));
        }
    }

    DecodeResult result{};
    result.tables = materializer.finish();
    if (opt.collect_metadata) {
        result.metadata = build_metadata_block(registry, stats, materializer.type_count());
    }
    const auto t2 = std::chrono::steady_clock::now();

    if (opt.debug) {
        const auto learn_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        const auto decode_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(t2 - t1).count();
        UAVLOG_LOG_INFO(
            "Decode %s: bytes=%zu formats=%zu records=%zu truncated=%zu fieldErrors=%zu "
            "learn=%lldms decode=%lldms",
            std::string(label).c_str(), bytes.size(), registry.size(), stats.records,
            stats.truncated_records, stats.field_errors, static_cast<long long>(learn_ms),
            static_cast<long long>(decode_ms)
        );
    }
    UAVLOG_LOG_INFO(
        "Universal parser decoded %zu message types from %s", materializer.type_count(),
        label.empty() ? "<buffer>" : std::string(label).c_str()
    );
    return result;
}

}  // namespace uavlog::df
