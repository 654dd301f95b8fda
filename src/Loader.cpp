/**
 * @file Loader.cpp
 * @brief JSON and TOML readers
 */

#include "cfgbind/Loader.hpp"
#include "cfgbind/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace cfgbind {

namespace {

template <typename T>
Value as_string_value(const T& temporal) {
    std::ostringstream ss;
    ss << temporal;
    return Value(ss.str());
}

Value from_toml(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, child] : *node.as_table()) {
                obj[std::string(key.str())] = from_toml(child);
            }
            return obj;
        }
        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& child : *node.as_array()) {
                arr.push_back(from_toml(child));
            }
            return arr;
        }
        case toml::node_type::string:         return Value(node.as_string()->get());
        case toml::node_type::integer:        return Value(node.as_integer()->get());
        case toml::node_type::floating_point: return Value(node.as_floating_point()->get());
        case toml::node_type::boolean:        return Value(node.as_boolean()->get());
        case toml::node_type::date:           return as_string_value(node.as_date()->get());
        case toml::node_type::time:           return as_string_value(node.as_time()->get());
        case toml::node_type::date_time:      return as_string_value(node.as_date_time()->get());
        default:                              return Value();
    }
}

// nlohmann reports a byte offset; turn it into 1-based line and column.
std::pair<int, int> line_and_column(const std::string& text, std::size_t byte) {
    byte = std::min(byte, text.size());
    int line = 1;
    int column = 1;
    for (std::size_t i = 0; i + 1 < byte; ++i) {
        if (text[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    return {line, column};
}

Value parse_json(const std::string& text, const std::string& source_name) {
    try {
        return Value::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        auto [line, column] = line_and_column(text, e.byte);
        throw ConfigParseError(source_name, line, column, e.what());
    }
}

Value parse_toml(const std::string& text, const std::string& source_name) {
    try {
        return from_toml(toml::parse(text, source_name));
    } catch (const toml::parse_error& e) {
        throw ConfigParseError(source_name,
                               static_cast<int>(e.source().begin.line),
                               static_cast<int>(e.source().begin.column),
                               std::string(e.description()));
    }
}

} // anonymous namespace

const char* to_string(ConfigFormat format) {
    switch (format) {
        case ConfigFormat::json: return "json";
        case ConfigFormat::toml: return "toml";
    }
    return "unknown";
}

std::optional<ConfigFormat> detect_format(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (ext == ".json") return ConfigFormat::json;
    if (ext == ".toml") return ConfigFormat::toml;
    return std::nullopt;
}

Value parse_config(const std::string& text, ConfigFormat format, const std::string& source_name) {
    return format == ConfigFormat::json ? parse_json(text, source_name)
                                        : parse_toml(text, source_name);
}

ConfigTree load_tree(const std::string& path) {
    if (path.empty()) {
        return ConfigTree();
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw FileNotFoundError(path);
    }

    auto format = detect_format(path);
    if (!format) {
        throw ConfigError("Unsupported config file type: " + path + " (expected .json or .toml)");
    }

    std::ostringstream text;
    text << in.rdbuf();
    return ConfigTree(parse_config(text.str(), *format, path));
}

} // namespace cfgbind
