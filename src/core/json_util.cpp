/**
 * @file json_util.cpp
 * @brief jsoncpp helper implementation.
 */

#include "core/json_util.hpp"

#include <fstream>
#include <memory>
#include <sstream>

namespace model_mesh::json {

Result<Json::Value> parse(std::string_view text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return Error{"JSON parse error: " + errors, ErrorKind::InvalidInput};
    }
    return root;
}

std::string write_compact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::string write_pretty(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

Result<Json::Value> read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{"Cannot open " + path.string(), ErrorKind::NotFound};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str());
}

Result<void> write_file(const std::filesystem::path& path, const Json::Value& value) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Error{"Cannot write " + tmp.string()};
        }
        out << write_pretty(value) << '\n';
        if (!out) {
            return Error{"Write failed for " + tmp.string()};
        }
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        return Error{"Cannot replace " + path.string() + ": " + ec.message()};
    }
    return Result<void>{};
}

std::optional<std::string> get_string(const Json::Value& obj, const char* key) {
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isString()) return std::nullopt;
    return obj[key].asString();
}

std::optional<int64_t> get_int(const Json::Value& obj, const char* key) {
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isInt64()) return std::nullopt;
    return obj[key].asInt64();
}

std::optional<uint64_t> get_uint(const Json::Value& obj, const char* key) {
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isUInt64()) return std::nullopt;
    return obj[key].asUInt64();
}

std::optional<bool> get_bool(const Json::Value& obj, const char* key) {
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isBool()) return std::nullopt;
    return obj[key].asBool();
}

}  // namespace model_mesh::json
