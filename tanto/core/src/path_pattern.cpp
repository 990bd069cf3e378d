#include "tanto/core/path_pattern.hpp"

#include <algorithm>
#include <cctype>

namespace tanto::http {

namespace {

bool valid_variable_name(std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    });
}

// Splits a route pattern on '/', ignoring slashes nested in braces so a
// constraint such as {id:\d{2,4}} stays in one piece.
result<std::vector<std::string_view>> split_pattern(std::string_view raw) {
    std::vector<std::string_view> parts;
    int depth = 0;
    size_t start = 1;
    for (size_t i = 1; i <= raw.size(); ++i) {
        char c = i < raw.size() ? raw[i] : '/';
        if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth < 0) {
                return std::unexpected(make_error_code(error_code::malformed_pattern));
            }
        } else if (c == '/' && depth == 0) {
            if (i > start) {
                parts.push_back(raw.substr(start, i - start));
            }
            start = i + 1;
        }
    }
    if (depth != 0) {
        return std::unexpected(make_error_code(error_code::malformed_pattern));
    }
    return parts;
}

} // namespace

bool glob_match(std::string_view pattern, std::string_view text) noexcept {
    size_t p = 0;
    size_t t = 0;
    size_t star = std::string_view::npos;
    size_t star_text = 0;
    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            star_text = t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++star_text;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

std::vector<std::string_view> path_pattern::split_path(std::string_view path) {
    std::vector<std::string_view> parts;
    size_t pos = 0;
    while (pos < path.size()) {
        if (path[pos] == '/') {
            ++pos;
            continue;
        }
        size_t next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        parts.push_back(path.substr(pos, next - pos));
        pos = next;
    }
    return parts;
}

result<path_pattern> path_pattern::compile(std::string_view raw) {
    if (raw.empty() || raw.front() != '/') {
        return std::unexpected(make_error_code(error_code::malformed_pattern));
    }

    auto parts = split_pattern(raw);
    if (!parts) {
        return std::unexpected(parts.error());
    }

    path_pattern pattern;
    pattern.source_ = std::string(raw);
    std::vector<std::string_view> names;

    for (size_t i = 0; i < parts->size(); ++i) {
        std::string_view segment = (*parts)[i];
        const bool last = i + 1 == parts->size();

        if (segment == "**" || segment == "**?") {
            if (!last) {
                return std::unexpected(make_error_code(error_code::malformed_pattern));
            }
            pattern.min_remainder_ = segment == "**" ? 1 : 0;
            pattern.segments_.push_back(path_segment{segment_kind::remainder, std::string(segment)});
            continue;
        }

        std::string_view name;
        std::string_view regex_text;
        if (segment.front() == '{') {
            if (segment.back() != '}') {
                return std::unexpected(make_error_code(error_code::malformed_pattern));
            }
            auto inner = segment.substr(1, segment.size() - 2);
            auto colon = inner.find(':');
            name = inner.substr(0, colon);
            if (colon != std::string_view::npos) {
                regex_text = inner.substr(colon + 1);
                if (regex_text.empty()) {
                    return std::unexpected(make_error_code(error_code::malformed_pattern));
                }
            }
        } else if (segment.front() == ':') {
            name = segment.substr(1);
        } else if (segment.find_first_of("{}") != std::string_view::npos) {
            return std::unexpected(make_error_code(error_code::malformed_pattern));
        } else if (segment.find_first_of("*?") != std::string_view::npos) {
            if (segment.find("**") != std::string_view::npos) {
                return std::unexpected(make_error_code(error_code::malformed_pattern));
            }
            pattern.segments_.push_back(path_segment{segment_kind::glob, std::string(segment)});
            continue;
        } else {
            pattern.segments_.push_back(path_segment{segment_kind::literal, std::string(segment)});
            continue;
        }

        if (!valid_variable_name(name)) {
            return std::unexpected(make_error_code(error_code::malformed_pattern));
        }
        if (std::find(names.begin(), names.end(), name) != names.end()) {
            return std::unexpected(make_error_code(error_code::duplicate_variable));
        }
        names.push_back(name);

        path_segment compiled{segment_kind::variable, std::string(name)};
        if (!regex_text.empty()) {
            try {
                compiled.constraint = std::make_shared<const std::regex>(
                    std::string(regex_text), std::regex::ECMAScript);
            } catch (const std::regex_error&) {
                return std::unexpected(make_error_code(error_code::malformed_pattern));
            }
        }
        pattern.segments_.push_back(std::move(compiled));
        ++pattern.variable_count_;
    }

    return pattern;
}

std::optional<path_params> path_pattern::match(std::string_view path) const {
    auto parts = split_path(path);
    const size_t fixed = min_remainder_ ? segments_.size() - 1 : segments_.size();

    if (min_remainder_) {
        if (parts.size() < fixed + *min_remainder_) {
            return std::nullopt;
        }
    } else if (parts.size() != fixed) {
        return std::nullopt;
    }

    path_params out;
    for (size_t i = 0; i < fixed; ++i) {
        const auto& segment = segments_[i];
        const auto actual = parts[i];

        switch (segment.kind) {
        case segment_kind::literal:
            if (segment.value != actual) {
                return std::nullopt;
            }
            break;
        case segment_kind::glob:
            if (!glob_match(segment.value, actual)) {
                return std::nullopt;
            }
            break;
        case segment_kind::variable:
            if (segment.constraint &&
                !std::regex_match(actual.begin(), actual.end(), *segment.constraint)) {
                return std::nullopt;
            }
            out.add(segment.value, std::string(actual));
            break;
        case segment_kind::remainder:
            break;
        }
    }

    if (min_remainder_) {
        std::string rest;
        for (size_t i = fixed; i < parts.size(); ++i) {
            if (!rest.empty()) {
                rest.push_back('/');
            }
            rest.append(parts[i]);
        }
        out.set_remainder(std::move(rest));
    }

    return out;
}

} // namespace tanto::http
