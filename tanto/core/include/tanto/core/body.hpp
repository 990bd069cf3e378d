#pragma once

#include "media_type.hpp"

#include <any>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <typeindex>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace tanto::http {

using bytes = std::vector<std::uint8_t>;

// Readable C++ name of type, e.g. "std::vector<int>" rather than the
// mangled symbol. Falls back to the raw name when demangling fails.
std::string type_name(std::type_index type);

// Describes the C++ type a converter is asked to read or write.
class value_shape {
public:
    explicit value_shape(const std::type_info& type) noexcept : type_(type) {}

    template <typename T> [[nodiscard]] static value_shape of() noexcept {
        return value_shape(typeid(T));
    }

    template <typename T> [[nodiscard]] bool is() const noexcept { return type_ == typeid(T); }

    [[nodiscard]] std::type_index type() const noexcept { return type_; }
    [[nodiscard]] std::string name() const { return type_name(type_); }

    bool operator==(const value_shape&) const = default;

private:
    std::type_index type_;
};

template <typename T>
concept streamable = requires(std::ostream& os, const T& value) { os << value; };

// An owned value of any copyable type, together with its shape and a
// human-readable rendering used by the debug converter.
class body_value {
public:
    body_value() = default;

    template <typename T>
        requires(!std::is_same_v<std::decay_t<T>, body_value> &&
                 !std::is_convertible_v<std::decay_t<T>, const char*>)
    body_value(T&& value)
        : value_(std::forward<T>(value)), describe_(&describe_impl<std::decay_t<T>>) {}

    // String literals are held as std::string.
    body_value(const char* text) : body_value(std::string(text)) {}

    [[nodiscard]] bool empty() const noexcept { return !value_.has_value(); }
    explicit operator bool() const noexcept { return !empty(); }

    [[nodiscard]] value_shape shape() const noexcept { return value_shape(value_.type()); }

    template <typename T> [[nodiscard]] const T* get() const noexcept {
        return std::any_cast<T>(&value_);
    }

    template <typename T> [[nodiscard]] T take() && { return std::any_cast<T>(std::move(value_)); }

    [[nodiscard]] std::string describe() const {
        return describe_ ? describe_(value_) : std::string();
    }

private:
    template <typename T> static std::string describe_impl(const std::any& value) {
        const auto& typed = std::any_cast<const T&>(value);
        if constexpr (streamable<T>) {
            std::ostringstream out;
            out << typed;
            return out.str();
        } else {
            return type_name(typeid(T));
        }
    }

    std::any value_;
    std::string (*describe_)(const std::any&) = nullptr;
};

// A static resource: a name, a media type and a way to open a fresh stream.
struct asset {
    std::string name;
    media_type type = media_type::octet_stream();
    std::function<std::unique_ptr<std::istream>()> open;

    // Media type derived from the file extension. The file is opened lazily.
    static asset from_file(const std::filesystem::path& file);
};

} // namespace tanto::http
