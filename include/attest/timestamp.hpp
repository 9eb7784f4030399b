#pragma once

#include "types.hpp"
#include <string>
#include <string_view>

namespace attest
{

    /**
     * Format as RFC 3339 in UTC with a "Z" suffix. Fractional seconds carry
     * up to nine digits with trailing zeros removed, and are omitted when zero.
     */
    std::string format_rfc3339_nano(Timestamp ts);

    /**
     * Parse an RFC 3339 timestamp with a "Z" or "+hh:mm"/"-hh:mm" offset and
     * up to nine fractional digits. Returns the UTC instant. Instants outside
     * the range of Timestamp (roughly 1677 to 2262) are rejected.
     */
    Result<Timestamp> parse_rfc3339(std::string_view text);

    /** Current wall-clock time at nanosecond resolution */
    Timestamp now_utc();

} // namespace attest
