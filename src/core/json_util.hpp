/**
 * @file json_util.hpp
 * @brief Thin helpers over jsoncpp for parsing, writing and typed field access.
 */

#pragma once

#include "core/result.hpp"

#include <json/json.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace model_mesh::json {

/// Parse a JSON document; malformed text yields ErrorKind::InvalidInput.
Result<Json::Value> parse(std::string_view text);

/// Serialize without indentation (wire format, NDJSON).
[[nodiscard]] std::string write_compact(const Json::Value& value);

/// Serialize with indentation (files read by people).
[[nodiscard]] std::string write_pretty(const Json::Value& value);

Result<Json::Value> read_file(const std::filesystem::path& path);
Result<void> write_file(const std::filesystem::path& path, const Json::Value& value);

// ── Typed accessors (never throw on type mismatch) ──

[[nodiscard]] std::optional<std::string> get_string(const Json::Value& obj, const char* key);
[[nodiscard]] std::optional<int64_t> get_int(const Json::Value& obj, const char* key);
[[nodiscard]] std::optional<uint64_t> get_uint(const Json::Value& obj, const char* key);
[[nodiscard]] std::optional<bool> get_bool(const Json::Value& obj, const char* key);

}  // namespace model_mesh::json
