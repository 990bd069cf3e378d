#include "tanto/core/media_type.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace tanto::http {

namespace {

std::string_view trim_ows(std::string_view value) noexcept {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    return value;
}

std::string lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

bool is_token(std::string_view s) noexcept {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        auto u = static_cast<unsigned char>(c);
        if (u <= 0x20 || u >= 0x7f) {
            return false;
        }
        switch (c) {
        case '(': case ')': case '<': case '>': case '@': case ',': case ';':
        case ':': case '\\': case '"': case '/': case '[': case ']': case '?':
        case '=': case '{': case '}':
            return false;
        default:
            break;
        }
    }
    return true;
}

std::optional<double> parse_quality(std::string_view text) noexcept {
    if (text.empty() || text.size() > 5) {
        return std::nullopt;
    }
    double q = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), q);
    if (ec != std::errc{} || ptr != text.data() + text.size() || q < 0.0 || q > 1.0) {
        return std::nullopt;
    }
    return q;
}

struct extension_entry {
    std::string_view ext;
    std::string_view type;
};

// Sorted by extension for binary search.
constexpr std::array<extension_entry, 44> extension_table = {{
    {"avif", "image/avif"},
    {"bin", "application/octet-stream"},
    {"bmp", "image/bmp"},
    {"coffee", "text/coffeescript"},
    {"css", "text/css"},
    {"csv", "text/csv"},
    {"eot", "application/vnd.ms-fontobject"},
    {"gif", "image/gif"},
    {"gz", "application/gzip"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"ico", "image/x-icon"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    {"js", "application/javascript"},
    {"json", "application/json"},
    {"less", "text/css"},
    {"map", "application/json"},
    {"md", "text/markdown"},
    {"mjs", "application/javascript"},
    {"mp3", "audio/mpeg"},
    {"mp4", "video/mp4"},
    {"ogg", "audio/ogg"},
    {"otf", "font/otf"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"properties", "text/plain"},
    {"rss", "application/rss+xml"},
    {"scss", "text/css"},
    {"svg", "image/svg+xml"},
    {"tar", "application/x-tar"},
    {"tif", "image/tiff"},
    {"tiff", "image/tiff"},
    {"ts", "application/typescript"},
    {"ttf", "font/ttf"},
    {"txt", "text/plain"},
    {"wasm", "application/wasm"},
    {"wav", "audio/wav"},
    {"webm", "video/webm"},
    {"webp", "image/webp"},
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"xml", "application/xml"},
    {"zip", "application/zip"},
}};

} // namespace

media_type::media_type(std::string_view type, std::string_view subtype, params_map params)
    : type_(lower(type)), subtype_(lower(subtype)) {
    for (auto& [key, value] : params) {
        params_.emplace(lower(key), std::move(value));
    }
    if (auto q = params_.find("q"); q != params_.end()) {
        quality_ = parse_quality(q->second).value_or(1.0);
    }
}

result<media_type> media_type::parse(std::string_view text) {
    auto rest = trim_ows(text);
    auto semicolon = rest.find(';');
    auto essence = trim_ows(rest.substr(0, semicolon));

    auto slash = essence.find('/');
    if (slash == std::string_view::npos) {
        // A lone "*" is sent by some clients for "*/*".
        if (essence == "*") {
            essence = "*/*";
            slash = 1;
        } else {
            return std::unexpected(make_error_code(error_code::malformed_media_type));
        }
    }

    auto type = essence.substr(0, slash);
    auto subtype = essence.substr(slash + 1);
    if (!is_token(type) || !is_token(subtype)) {
        return std::unexpected(make_error_code(error_code::malformed_media_type));
    }
    if (type == "*" && subtype != "*") {
        return std::unexpected(make_error_code(error_code::malformed_media_type));
    }

    params_map params;
    while (semicolon != std::string_view::npos) {
        rest = rest.substr(semicolon + 1);
        semicolon = rest.find(';');
        auto item = trim_ows(rest.substr(0, semicolon));
        if (item.empty()) {
            continue;
        }
        auto eq = item.find('=');
        if (eq == std::string_view::npos) {
            return std::unexpected(make_error_code(error_code::malformed_media_type));
        }
        auto key = trim_ows(item.substr(0, eq));
        auto value = trim_ows(item.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        if (!is_token(key)) {
            return std::unexpected(make_error_code(error_code::malformed_media_type));
        }
        auto lkey = lower(key);
        if (lkey == "q" && !parse_quality(value)) {
            return std::unexpected(make_error_code(error_code::malformed_media_type));
        }
        params.insert_or_assign(std::move(lkey), std::string(value));
    }

    return media_type(type, subtype, std::move(params));
}

std::vector<media_type> media_type::parse_list(std::string_view header) {
    std::vector<media_type> out;
    bool in_quotes = false;
    size_t start = 0;
    for (size_t i = 0; i <= header.size(); ++i) {
        if (i < header.size()) {
            if (header[i] == '"') {
                in_quotes = !in_quotes;
            }
            if (header[i] != ',' || in_quotes) {
                continue;
            }
        }
        auto part = trim_ows(header.substr(start, i - start));
        start = i + 1;
        if (part.empty()) {
            continue;
        }
        if (auto parsed = parse(part)) {
            out.push_back(std::move(*parsed));
        }
    }
    return out;
}

std::optional<std::string_view> media_type::param(std::string_view key) const {
    auto it = params_.find(lower(key));
    if (it == params_.end()) {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

bool media_type::is_text_like() const noexcept {
    if (type_ == "text") {
        return true;
    }
    if (subtype_ == "json" || subtype_ == "xml" || subtype_ == "javascript" ||
        subtype_ == "css") {
        return true;
    }
    return subtype_.ends_with("+json") || subtype_.ends_with("+xml");
}

bool media_type::matches(const media_type& other) const noexcept {
    return match_specificity(other) != no_match;
}

int media_type::match_specificity(const media_type& other) const noexcept {
    int score = 0;
    if (is_wildcard_type() || other.is_wildcard_type()) {
        // "*/x" never parses, so a wildcard type implies a wildcard subtype.
        return 0;
    }
    if (type_ != other.type_) {
        return no_match;
    }
    ++score;
    if (is_wildcard_subtype() || other.is_wildcard_subtype()) {
        return score;
    }
    if (subtype_ != other.subtype_) {
        return no_match;
    }
    return score + 1;
}

media_type media_type::with_param(std::string_view key, std::string_view value) const {
    params_map params = params_;
    params.insert_or_assign(lower(key), std::string(value));
    return media_type(type_, subtype_, std::move(params));
}

std::string media_type::to_string() const {
    std::string out = name();
    for (const auto& [key, value] : params_) {
        out.push_back(';');
        out.append(key);
        out.push_back('=');
        out.append(value);
    }
    return out;
}

bool media_type::operator==(const media_type& other) const noexcept {
    if (type_ != other.type_ || subtype_ != other.subtype_) {
        return false;
    }
    auto skip_q = [](const params_map& m) {
        params_map copy = m;
        copy.erase("q");
        return copy;
    };
    return skip_q(params_) == skip_q(other.params_);
}

const media_type& media_type::all() {
    static const media_type instance("*", "*");
    return instance;
}

const media_type& media_type::text_any() {
    static const media_type instance("text", "*");
    return instance;
}

const media_type& media_type::plain() {
    static const media_type instance("text", "plain");
    return instance;
}

const media_type& media_type::html() {
    static const media_type instance("text", "html");
    return instance;
}

const media_type& media_type::css() {
    static const media_type instance("text", "css");
    return instance;
}

const media_type& media_type::javascript() {
    static const media_type instance("application", "javascript");
    return instance;
}

const media_type& media_type::json() {
    static const media_type instance("application", "json");
    return instance;
}

const media_type& media_type::xml() {
    static const media_type instance("application", "xml");
    return instance;
}

const media_type& media_type::form() {
    static const media_type instance("application", "x-www-form-urlencoded");
    return instance;
}

const media_type& media_type::multipart() {
    static const media_type instance("multipart", "form-data");
    return instance;
}

const media_type& media_type::octet_stream() {
    static const media_type instance("application", "octet-stream");
    return instance;
}

const media_type& media_type::problem_json() {
    static const media_type instance("application", "problem+json");
    return instance;
}

media_type media_type::by_extension(std::string_view ext) {
    auto key = lower(ext);
    auto it = std::lower_bound(extension_table.begin(),
                               extension_table.end(),
                               key,
                               [](const extension_entry& e, const std::string& k) {
                                   return e.ext < std::string_view(k);
                               });
    if (it == extension_table.end() || it->ext != key) {
        return octet_stream();
    }
    auto slash = it->type.find('/');
    return media_type(it->type.substr(0, slash), it->type.substr(slash + 1));
}

media_type media_type::by_path(std::string_view path) {
    auto slash = path.find_last_of('/');
    auto file = slash == std::string_view::npos ? path : path.substr(slash + 1);
    auto dot = file.find_last_of('.');
    if (dot == std::string_view::npos || dot + 1 == file.size()) {
        return octet_stream();
    }
    return by_extension(file.substr(dot + 1));
}

} // namespace tanto::http
