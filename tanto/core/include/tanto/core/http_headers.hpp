#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tanto::http {

inline bool ci_char_equal(char a, char b) noexcept {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
}

inline bool ci_equal(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), ci_char_equal);
}

// Header fields with case-insensitive names. A name may carry several values;
// fields keep the order in which they were added.
class headers_map {
public:
    using entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<entry>::const_iterator;

    headers_map() = default;

    void add(std::string_view name, std::string_view value) {
        entries_.emplace_back(std::string(name), std::string(value));
    }

    // Replaces every value of name with a single one.
    void set(std::string_view name, std::string_view value) {
        for (auto& e : entries_) {
            if (ci_equal(e.first, name)) {
                e.second = std::string(value);
                remove_after(name, &e);
                return;
            }
        }
        add(name, value);
    }

    [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept {
        for (const auto& e : entries_) {
            if (ci_equal(e.first, name)) {
                return std::string_view(e.second);
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::vector<std::string_view> get_all(std::string_view name) const {
        std::vector<std::string_view> values;
        for (const auto& e : entries_) {
            if (ci_equal(e.first, name)) {
                values.emplace_back(e.second);
            }
        }
        return values;
    }

    // All values of name joined with ", ", as a list-valued field would be.
    [[nodiscard]] std::optional<std::string> get_joined(std::string_view name) const {
        std::optional<std::string> joined;
        for (const auto& e : entries_) {
            if (!ci_equal(e.first, name)) {
                continue;
            }
            if (!joined) {
                joined.emplace(e.second);
            } else {
                joined->append(", ");
                joined->append(e.second);
            }
        }
        return joined;
    }

    [[nodiscard]] bool contains(std::string_view name) const noexcept {
        return get(name).has_value();
    }

    void remove(std::string_view name) {
        std::erase_if(entries_, [name](const entry& e) { return ci_equal(e.first, name); });
    }

    void clear() noexcept { entries_.clear(); }

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    void remove_after(std::string_view name, const entry* keep) {
        auto first = entries_.begin() + (keep - entries_.data()) + 1;
        entries_.erase(std::remove_if(first,
                                      entries_.end(),
                                      [name](const entry& e) { return ci_equal(e.first, name); }),
                       entries_.end());
    }

    std::vector<entry> entries_;
};

} // namespace tanto::http
