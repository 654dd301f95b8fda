/**
 * @file DotPath.cpp
 * @brief Implementation of path utilities
 */

#include "cfgbind/DotPath.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace cfgbind {

std::vector<std::string> split_dot_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

namespace {
    /**
     * @brief Check if segment represents an array index
     *
     * Must be all digits, no leading zeros except "0" itself.
     */
    bool is_array_index(const std::string& segment) {
        if (segment.empty()) return false;
        if (segment[0] == '0' && segment.size() > 1) return false;
        return std::all_of(segment.begin(), segment.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    /**
     * @brief Step from a container into one child
     * @return The child, or nullptr if the segment does not name one
     * @pre current is an object or array
     */
    const Value* step(const Value& current, const std::string& seg) {
        if (current.is_object()) {
            auto it = current.find(seg);
            return it == current.end() ? nullptr : &*it;
        }
        if (!is_array_index(seg)) {
            return nullptr;
        }
        size_t idx = 0;
        const char* last = seg.data() + seg.size();
        auto [end, ec] = std::from_chars(seg.data(), last, idx);
        if (ec != std::errc() || end != last || idx >= current.size()) {
            return nullptr;
        }
        return &current[idx];
    }
}

const Value* get_by_dot(const Value& data, const std::string& path) {
    const Value* current = &data;

    for (const auto& seg : split_dot_path(path)) {
        if (!is_container(*current)) {
            throw TypeError(path, "object or array", type_name(*current));
        }

        const Value* next = step(*current, seg);
        if (next == nullptr) {
            if (current->is_array()) {
                throw KeyError(path, seg + " (not a valid array index)");
            }
            throw KeyError(path, seg);
        }
        current = next;
    }

    return current;
}

const Value* find_by_path(const Value& data, const std::vector<std::string>& segments) {
    const Value* current = &data;

    for (const auto& seg : segments) {
        if (!is_container(*current)) {
            return nullptr;
        }
        current = step(*current, seg);
        if (current == nullptr) {
            return nullptr;
        }
    }

    return current;
}

bool contains_dot(const Value& data, const std::string& path) {
    const Value* current = &data;

    for (const auto& seg : split_dot_path(path)) {
        if (!is_container(*current)) {
            throw TypeError(path, "object or array", type_name(*current));
        }
        current = step(*current, seg);
        if (current == nullptr) {
            return false;
        }
    }

    return true;
}

} // namespace cfgbind
