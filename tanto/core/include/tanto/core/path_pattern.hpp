#pragma once

#include "result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tanto::http {

enum class segment_kind : uint8_t {
    literal,   // exact, case-sensitive
    glob,      // '?' matches one character, '*' any run, never '/'
    variable,  // {name} or :name, optionally {name:regex}
    remainder, // trailing "**" (one or more segments) or "**?" (zero or more)
};

struct path_segment {
    segment_kind kind{segment_kind::literal};
    std::string value{}; // literal text, glob text or variable name
    std::shared_ptr<const std::regex> constraint{};
};

// Captured variables of one successful match, in pattern order.
class path_params {
public:
    using param_entry = std::pair<std::string, std::string>;

    void add(std::string name, std::string value) {
        entries_.emplace_back(std::move(name), std::move(value));
    }

    [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept {
        for (const auto& entry : entries_) {
            if (entry.first == name) {
                return std::string_view(entry.second);
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] std::span<const param_entry> entries() const noexcept { return entries_; }

    // Text matched by a trailing wildcard, without leading or trailing '/'.
    [[nodiscard]] const std::optional<std::string>& remainder() const noexcept {
        return remainder_;
    }
    void set_remainder(std::string value) { remainder_ = std::move(value); }

    bool operator==(const path_params&) const = default;

private:
    std::vector<param_entry> entries_;
    std::optional<std::string> remainder_;
};

class path_pattern {
public:
    // Compiles a route path. Fails with malformed_pattern when the path does
    // not start with '/', a brace is unbalanced, a variable name is empty or
    // invalid, a regex constraint does not compile, or "**" is not the final
    // segment; fails with duplicate_variable when a name repeats.
    [[nodiscard]] static result<path_pattern> compile(std::string_view path);

    // Pure: no state is touched, equal inputs give equal outputs.
    [[nodiscard]] std::optional<path_params> match(std::string_view path) const;

    [[nodiscard]] const std::string& source() const noexcept { return source_; }
    [[nodiscard]] std::span<const path_segment> segments() const noexcept { return segments_; }
    [[nodiscard]] bool has_remainder() const noexcept { return min_remainder_.has_value(); }
    [[nodiscard]] size_t variable_count() const noexcept { return variable_count_; }

    [[nodiscard]] static std::vector<std::string_view> split_path(std::string_view path);

private:
    std::string source_;
    std::vector<path_segment> segments_;
    std::optional<size_t> min_remainder_; // set when the pattern ends in a wildcard
    size_t variable_count_{0};
};

// Glob match of a single segment: '?' is one character, '*' any run.
[[nodiscard]] bool glob_match(std::string_view pattern, std::string_view text) noexcept;

} // namespace tanto::http
