#pragma once

#include "media_type.hpp"
#include "result.hpp"

#include <optional>
#include <span>

namespace tanto::http {

// Picks the producible type the client prefers.
//
// Each producible type is scored against the Accept entry that applies to it:
// the matching entry with the highest specificity (exact/exact over
// exact/wildcard over wildcard/wildcard), then the highest quality, then the
// earliest position in the header. An applicable entry with q=0 refuses the
// type. The producible type with the best (specificity, quality) score wins;
// ties go to the earlier declaration. An empty Accept list accepts anything
// and yields the first producible type.
//
// When the winning declaration is a range such as text/* and the applicable
// Accept entry is concrete, the concrete type is returned.
//
// Fails with error_code::not_acceptable.
[[nodiscard]] result<media_type> negotiate_produces(std::span<const media_type> accepted,
                                                    std::span<const media_type> producible);

// Succeeds when consumable is empty or content_type matches one of its
// entries; otherwise fails with error_code::unsupported_media_type. A request
// without a usable Content-Type never satisfies a non-empty consumable list.
[[nodiscard]] result<void> negotiate_consumes(const std::optional<media_type>& content_type,
                                              std::span<const media_type> consumable);

} // namespace tanto::http
