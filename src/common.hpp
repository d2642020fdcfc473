#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace detsim
{
    // Simulated time in nanoseconds since the start of the run.
    using SimInstant = std::uint64_t;

    // Signed so that callers can pass negative delays (treated as zero) and clock skews.
    using SimDuration = std::int64_t;

    using HostId = std::uint32_t;
    using TaskId = std::uint64_t;
    using TimerHandle = std::uint64_t;
    using ConnectionId = std::uint64_t;
    using ListenerId = std::uint64_t;

    // HostId 0 is never handed out to a registered host. Runtime-owned entropy
    // streams (chaos generation) are keyed by it.
    inline constexpr HostId RuntimeHost = 0;

    using ByteBuffer = std::vector<std::byte>;

    inline constexpr SimDuration nanos(std::int64_t n) noexcept { return n; }
    inline constexpr SimDuration micros(std::int64_t n) noexcept { return n * 1000; }
    inline constexpr SimDuration millis(std::int64_t n) noexcept { return n * 1000 * 1000; }
    inline constexpr SimDuration seconds(std::int64_t n) noexcept { return n * 1000 * 1000 * 1000; }

    // now + delay, with negative delays clamped to zero and saturation at the top of the range.
    inline constexpr SimInstant instant_after(SimInstant now, SimDuration delay) noexcept
    {
        if (delay <= 0)
        {
            return now;
        }
        const auto d = static_cast<std::uint64_t>(delay);
        if (std::numeric_limits<SimInstant>::max() - now < d)
        {
            return std::numeric_limits<SimInstant>::max();
        }
        return now + d;
    }

    // Host clock view: applies a signed offset, saturating at both ends.
    inline constexpr SimInstant apply_skew(SimInstant now, SimDuration skew) noexcept
    {
        if (skew >= 0)
        {
            return instant_after(now, skew);
        }
        const auto back = static_cast<std::uint64_t>(-(skew + 1)) + 1;
        return (back > now) ? 0 : now - back;
    }

    inline ByteBuffer bytes_of(std::string_view s)
    {
        ByteBuffer out(s.size());
        if (!s.empty())
        {
            std::memcpy(out.data(), s.data(), s.size());
        }
        return out;
    }

    inline std::string string_of(std::span<const std::byte> bytes)
    {
        return std::string(reinterpret_cast<const char *>(bytes.data()), bytes.size());
    }
}
