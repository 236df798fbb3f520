/**
 * @file Diff.cpp
 * @brief Implementation of structural diff
 */

#include "jpatch/Diff.hpp"
#include "jpatch/Document.hpp"

#include <algorithm>
#include <cstddef>

namespace jpatch {

namespace {

void diff_value(const Value& from, const Value& to, Pointer& path, Patch& out);

void diff_object(const Value& from, const Value& to, Pointer& path, Patch& out) {
    // Keys that disappeared
    for (auto it = from.begin(); it != from.end(); ++it) {
        if (to.find(it.key()) == to.end()) {
            path.push_back(it.key());
            out.push_back(Operation::remove(path));
            path.pop_back();
        }
    }

    // Changed and new keys, in target order
    for (auto it = to.begin(); it != to.end(); ++it) {
        path.push_back(it.key());
        auto existing = from.find(it.key());
        if (existing == from.end()) {
            out.push_back(Operation::add(path, it.value()));
        } else {
            diff_value(*existing, it.value(), path, out);
        }
        path.pop_back();
    }
}

void diff_array(const Value& from, const Value& to, Pointer& path, Patch& out) {
    const std::size_t n = from.size();
    const std::size_t m = to.size();

    std::size_t prefix = 0;
    while (prefix < n && prefix < m && deep_equal(from[prefix], to[prefix])) {
        ++prefix;
    }

    std::size_t suffix = 0;
    while (suffix < n - prefix && suffix < m - prefix &&
           deep_equal(from[n - 1 - suffix], to[m - 1 - suffix])) {
        ++suffix;
    }

    const std::size_t from_len = n - prefix - suffix;
    const std::size_t to_len = m - prefix - suffix;
    const std::size_t common = std::min(from_len, to_len);

    for (std::size_t i = 0; i < common; ++i) {
        path.push_back(std::to_string(prefix + i));
        diff_value(from[prefix + i], to[prefix + i], path, out);
        path.pop_back();
    }

    // Highest index first so the remaining indices stay valid
    for (std::size_t i = from_len; i > common; --i) {
        path.push_back(std::to_string(prefix + i - 1));
        out.push_back(Operation::remove(path));
        path.pop_back();
    }

    for (std::size_t i = common; i < to_len; ++i) {
        path.push_back(std::to_string(prefix + i));
        out.push_back(Operation::add(path, to[prefix + i]));
        path.pop_back();
    }
}

void diff_value(const Value& from, const Value& to, Pointer& path, Patch& out) {
    if (deep_equal(from, to)) {
        return;
    }

    if (from.is_object() && to.is_object()) {
        diff_object(from, to, path, out);
    } else if (from.is_array() && to.is_array()) {
        diff_array(from, to, path, out);
    } else {
        out.push_back(Operation::replace(path, to));
    }
}

} // anonymous namespace

Patch diff(const Value& from, const Value& to) {
    Patch patch;
    Pointer path;
    diff_value(from, to, path, patch);
    return patch;
}

} // namespace jpatch
