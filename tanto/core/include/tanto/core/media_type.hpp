#pragma once

#include "result.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tanto::http {

// A content type such as "application/json;charset=utf-8" or "text/*;q=0.5".
// Type, subtype and parameter names are stored lower-case. Immutable.
class media_type {
public:
    using params_map = std::map<std::string, std::string>;

    static constexpr int no_match = -1;

    media_type(std::string_view type, std::string_view subtype, params_map params = {});

    // Parses a single media range. "*/json" and empty components are rejected.
    [[nodiscard]] static result<media_type> parse(std::string_view text);

    // Parses a comma separated header value (Accept). Malformed entries are
    // skipped; the returned list keeps header order.
    [[nodiscard]] static std::vector<media_type> parse_list(std::string_view header);

    [[nodiscard]] const std::string& type() const noexcept { return type_; }
    [[nodiscard]] const std::string& subtype() const noexcept { return subtype_; }
    [[nodiscard]] const params_map& params() const noexcept { return params_; }
    [[nodiscard]] std::string name() const { return type_ + "/" + subtype_; }

    [[nodiscard]] std::optional<std::string_view> param(std::string_view key) const;
    [[nodiscard]] std::optional<std::string_view> charset() const { return param("charset"); }

    // Quality from the "q" parameter, 1.0 when absent.
    [[nodiscard]] double quality() const noexcept { return quality_; }

    [[nodiscard]] bool is_wildcard_type() const noexcept { return type_ == "*"; }
    [[nodiscard]] bool is_wildcard_subtype() const noexcept { return subtype_ == "*"; }
    [[nodiscard]] bool is_concrete() const noexcept {
        return !is_wildcard_type() && !is_wildcard_subtype();
    }

    // text/*, json, xml, javascript, css and their +json/+xml suffixed kin.
    [[nodiscard]] bool is_text_like() const noexcept;

    // Symmetric: either side may carry wildcards. Parameters are ignored.
    [[nodiscard]] bool matches(const media_type& other) const noexcept;

    // Number of components matched literally rather than through a wildcard:
    // 2 exact/exact, 1 exact/wildcard, 0 wildcard/wildcard, no_match otherwise.
    [[nodiscard]] int match_specificity(const media_type& other) const noexcept;

    [[nodiscard]] media_type with_param(std::string_view key, std::string_view value) const;
    [[nodiscard]] media_type without_params() const { return media_type(type_, subtype_); }

    [[nodiscard]] std::string to_string() const;

    // Type, subtype and parameters other than "q" must be equal.
    bool operator==(const media_type& other) const noexcept;

    static const media_type& all();
    static const media_type& text_any();
    static const media_type& plain();
    static const media_type& html();
    static const media_type& css();
    static const media_type& javascript();
    static const media_type& json();
    static const media_type& xml();
    static const media_type& form();
    static const media_type& multipart();
    static const media_type& octet_stream();
    static const media_type& problem_json();

    // Lookup by file extension without the leading dot, case-insensitive.
    // Unknown extensions map to application/octet-stream.
    [[nodiscard]] static media_type by_extension(std::string_view ext);
    [[nodiscard]] static media_type by_path(std::string_view path);

private:
    std::string type_;
    std::string subtype_;
    params_map params_;
    double quality_ = 1.0;
};

} // namespace tanto::http
