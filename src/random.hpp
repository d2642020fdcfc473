#pragma once

#include "common.hpp"

#include <stdexcept>
#include <utility>

namespace detsim
{
    // Entropy for a simulation run.
    //
    // Every random decision in the simulated universe (latency, loss, chaos
    // schedules, application jitter) is drawn from a stream keyed by
    // (master seed, host, purpose). The derivation is a pure function of those
    // three values, so a stream never depends on registration order, container
    // iteration order or addresses.

    inline std::uint64_t splitmix64(std::uint64_t x) noexcept
    {
        x += 0x9e3779b97f4a7c15ULL;
        x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
        x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
        return x ^ (x >> 31);
    }

    inline std::uint64_t mix_u64(std::uint64_t a, std::uint64_t b) noexcept
    {
        return splitmix64(a ^ splitmix64(b));
    }

    inline std::uint64_t fnv1a64(std::span<const std::byte> bytes) noexcept
    {
        std::uint64_t h = 1469598103934665603ULL;
        for (const std::byte b : bytes)
        {
            h ^= static_cast<std::uint64_t>(static_cast<unsigned char>(b));
            h *= 1099511628211ULL;
        }
        return h;
    }

    inline std::uint64_t fnv1a64(std::string_view s) noexcept
    {
        return fnv1a64(std::span<const std::byte>(reinterpret_cast<const std::byte *>(s.data()), s.size()));
    }

    inline std::uint64_t derive_stream_seed(std::uint64_t masterSeed, HostId host, std::string_view purpose) noexcept
    {
        std::uint64_t x = masterSeed;
        x = mix_u64(x, static_cast<std::uint64_t>(host));
        x = mix_u64(x, fnv1a64(purpose));
        return splitmix64(x);
    }

    class EntropyStream
    {
    public:
        explicit EntropyStream(std::uint64_t streamSeed) noexcept : m_seed(streamSeed) {}

        std::uint64_t next_u64() noexcept
        {
            const std::uint64_t draw = m_draws++;
            return splitmix64(mix_u64(m_seed, draw));
        }

        // Uniform in [0,1) from the top 53 bits of one draw.
        double next_unit() noexcept
        {
            const std::uint64_t mantissa = next_u64() >> 11;
            return static_cast<double>(mantissa) * (1.0 / 9007199254740992.0); // 2^53
        }

        // Uniform integer in [lo, hi] (inclusive).
        std::uint64_t next_range(std::uint64_t lo, std::uint64_t hi)
        {
            if (lo > hi)
            {
                throw std::invalid_argument("EntropyStream::next_range: lo > hi");
            }
            const std::uint64_t r = next_u64();
            const std::uint64_t span = hi - lo;
            if (span == std::numeric_limits<std::uint64_t>::max())
            {
                return r;
            }
            // Modulo bias is negligible for the ranges simulations ask for.
            return lo + (r % (span + 1));
        }

        std::int64_t next_range_signed(std::int64_t lo, std::int64_t hi)
        {
            if (lo > hi)
            {
                throw std::invalid_argument("EntropyStream::next_range_signed: lo > hi");
            }
            const auto width = static_cast<std::uint64_t>(hi) - static_cast<std::uint64_t>(lo);
            return static_cast<std::int64_t>(static_cast<std::uint64_t>(lo) + next_range(0, width));
        }

        // True with probability p. Always consumes exactly one draw, so call
        // counts stay aligned whatever p is.
        bool next_bool(double p) noexcept
        {
            const double u = next_unit();
            if (p <= 0.0)
            {
                return false;
            }
            if (p >= 1.0)
            {
                return true;
            }
            return u < p;
        }

        std::size_t choose_index(std::size_t n)
        {
            if (n == 0)
            {
                throw std::invalid_argument("EntropyStream::choose_index: empty set");
            }
            return static_cast<std::size_t>(next_range(0, static_cast<std::uint64_t>(n - 1)));
        }

        template <class T>
        const T &choose(const std::vector<T> &items)
        {
            return items[choose_index(items.size())];
        }

        std::uint64_t seed() const noexcept { return m_seed; }
        std::uint64_t draws() const noexcept { return m_draws; }

    private:
        std::uint64_t m_seed = 0;
        std::uint64_t m_draws = 0;
    };

    class EntropyManager
    {
    public:
        explicit EntropyManager(std::uint64_t masterSeed) noexcept : m_masterSeed(masterSeed) {}

        std::uint64_t master_seed() const noexcept { return m_masterSeed; }

        // Returns the stream for (host, purpose), creating it on first use. The
        // same key always yields the same object, so draws continue where the
        // previous caller stopped.
        EntropyStream &stream_for(HostId host, std::string_view purpose)
        {
            auto key = std::make_pair(host, std::string(purpose));
            auto it = m_streams.find(key);
            if (it == m_streams.end())
            {
                const std::uint64_t seed = derive_stream_seed(m_masterSeed, host, purpose);
                it = m_streams.emplace(std::move(key), EntropyStream(seed)).first;
            }
            return it->second;
        }

        std::uint64_t fork_seed(HostId host, std::string_view purpose) const noexcept
        {
            return derive_stream_seed(m_masterSeed, host, purpose);
        }

        std::size_t stream_count() const noexcept { return m_streams.size(); }

    private:
        std::uint64_t m_masterSeed = 0;
        std::map<std::pair<HostId, std::string>, EntropyStream> m_streams;
    };
}
