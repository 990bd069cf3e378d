#include "tanto/core/content_negotiation.hpp"

#include <algorithm>

namespace tanto::http {

namespace {

struct score {
    int specificity = media_type::no_match;
    double quality = 0.0;

    [[nodiscard]] bool better_than(const score& other) const noexcept {
        if (specificity != other.specificity) {
            return specificity > other.specificity;
        }
        return quality > other.quality;
    }
};

} // namespace

result<media_type> negotiate_produces(std::span<const media_type> accepted,
                                      std::span<const media_type> producible) {
    if (producible.empty()) {
        return std::unexpected(make_error_code(error_code::not_acceptable));
    }
    if (accepted.empty()) {
        return producible.front();
    }

    const media_type* best_type = nullptr;
    const media_type* best_range = nullptr;
    score best{};

    for (const auto& candidate : producible) {
        const media_type* range = nullptr;
        score applicable{};
        for (const auto& requested : accepted) {
            score s{candidate.match_specificity(requested), requested.quality()};
            if (s.specificity == media_type::no_match) {
                continue;
            }
            // Strictly better only: equal entries keep header order.
            if (!range || s.better_than(applicable)) {
                range = &requested;
                applicable = s;
            }
        }

        if (!range || applicable.quality <= 0.0) {
            continue;
        }
        if (!best_type || applicable.better_than(best)) {
            best_type = &candidate;
            best_range = range;
            best = applicable;
        }
    }

    if (!best_type) {
        return std::unexpected(make_error_code(error_code::not_acceptable));
    }
    if (!best_type->is_concrete() && best_range->is_concrete()) {
        return best_range->without_params();
    }
    return *best_type;
}

result<void> negotiate_consumes(const std::optional<media_type>& content_type,
                                std::span<const media_type> consumable) {
    if (consumable.empty()) {
        return {};
    }
    if (!content_type) {
        return std::unexpected(make_error_code(error_code::unsupported_media_type));
    }
    bool accepted = std::any_of(consumable.begin(), consumable.end(), [&](const media_type& t) {
        return t.matches(*content_type);
    });
    if (!accepted) {
        return std::unexpected(make_error_code(error_code::unsupported_media_type));
    }
    return {};
}

} // namespace tanto::http
