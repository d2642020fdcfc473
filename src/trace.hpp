#pragma once

#include "random.hpp"
#include "wire.hpp"

#include <functional>
#include <stdexcept>

namespace detsim
{
    enum class TraceKind : std::uint8_t
    {
        TaskSpawn = 1,
        TaskComplete = 2,
        TaskFail = 3,
        TaskCancel = 4,
        TimerFire = 5,
        Connect = 6,
        Accept = 7,
        Close = 8,
        Send = 9,
        SendRejected = 10,
        Deliver = 11,
        DropLoss = 12,
        DropPartition = 13,
        DropClosed = 14,
        Fault = 15,
    };

    inline const char *trace_kind_name(TraceKind k) noexcept
    {
        switch (k)
        {
        case TraceKind::TaskSpawn:
            return "task-spawn";
        case TraceKind::TaskComplete:
            return "task-complete";
        case TraceKind::TaskFail:
            return "task-fail";
        case TraceKind::TaskCancel:
            return "task-cancel";
        case TraceKind::TimerFire:
            return "timer-fire";
        case TraceKind::Connect:
            return "connect";
        case TraceKind::Accept:
            return "accept";
        case TraceKind::Close:
            return "close";
        case TraceKind::Send:
            return "send";
        case TraceKind::SendRejected:
            return "send-rejected";
        case TraceKind::Deliver:
            return "deliver";
        case TraceKind::DropLoss:
            return "drop-loss";
        case TraceKind::DropPartition:
            return "drop-partition";
        case TraceKind::DropClosed:
            return "drop-closed";
        case TraceKind::Fault:
            return "fault";
        }
        return "unknown";
    }

    // One entry of the ordered event trail. The meaning of `a` and `b` depends on
    // the kind (task id, timer handle, connection id, payload hash, fault kind...).
    struct TraceRecord
    {
        SimInstant at = 0;
        TraceKind kind = TraceKind::TaskSpawn;
        HostId host = 0;
        HostId peer = 0;
        std::uint64_t a = 0;
        std::uint64_t b = 0;

        bool operator==(const TraceRecord &o) const noexcept
        {
            return at == o.at && kind == o.kind && host == o.host && peer == o.peer && a == o.a && b == o.b;
        }
    };

    inline std::string format_record(const TraceRecord &r)
    {
        return "t=" + std::to_string(r.at) + " " + trace_kind_name(r.kind) +
               " host=" + std::to_string(r.host) + " peer=" + std::to_string(r.peer) +
               " a=" + std::to_string(r.a) + " b=" + std::to_string(r.b);
    }

    inline std::uint64_t hash_record(const TraceRecord &r) noexcept
    {
        std::uint64_t h = mix_u64(r.at, static_cast<std::uint64_t>(r.kind));
        h = mix_u64(h, (static_cast<std::uint64_t>(r.host) << 32) | r.peer);
        h = mix_u64(h, r.a);
        return mix_u64(h, r.b);
    }

    inline ByteBuffer encode_trail(const std::vector<TraceRecord> &records)
    {
        WireWriter w;
        w.write_u32(static_cast<std::uint32_t>(records.size()));
        for (const auto &r : records)
        {
            w.write_u64(r.at);
            w.write_u8(static_cast<std::uint8_t>(r.kind));
            w.write_u32(r.host);
            w.write_u32(r.peer);
            w.write_u64(r.a);
            w.write_u64(r.b);
        }
        return w.take();
    }

    inline std::vector<TraceRecord> decode_trail(std::span<const std::byte> bytes)
    {
        WireReader r(bytes);
        const std::uint32_t n = r.read_u32();
        std::vector<TraceRecord> out;
        out.reserve(std::min<std::size_t>(n, bytes.size()));
        for (std::uint32_t i = 0; i < n; ++i)
        {
            TraceRecord rec;
            rec.at = r.read_u64();
            const std::uint8_t kind = r.read_u8();
            if (kind < static_cast<std::uint8_t>(TraceKind::TaskSpawn) || kind > static_cast<std::uint8_t>(TraceKind::Fault))
            {
                throw std::runtime_error("decode_trail: unknown record kind " + std::to_string(kind));
            }
            rec.kind = static_cast<TraceKind>(kind);
            rec.host = r.read_u32();
            rec.peer = r.read_u32();
            rec.a = r.read_u64();
            rec.b = r.read_u64();
            out.push_back(rec);
        }
        r.expect_end();
        return out;
    }

    // Ordered event trail of a run.
    //
    // The running digest is always maintained; full records are kept only when
    // recording is enabled. With an expected trail installed, the first record
    // that differs from the expectation is remembered as the divergence point.
    class EventTrail
    {
    public:
        void set_recording(bool on) { m_recording = on; }
        bool recording() const noexcept { return m_recording; }

        void set_sink(std::function<void(const TraceRecord &)> sink) { m_sink = std::move(sink); }

        void set_expected(std::vector<TraceRecord> expected)
        {
            m_expected = std::move(expected);
            m_hasExpected = true;
        }

        void record(const TraceRecord &r)
        {
            m_digest = mix_u64(m_digest, hash_record(r));
            if (m_hasExpected && !m_divergence)
            {
                if (m_count >= m_expected.size() || !(m_expected[m_count] == r))
                {
                    m_divergence = m_count;
                    m_divergenceAt = r.at;
                }
            }
            ++m_count;
            if (m_recording)
            {
                m_records.push_back(r);
            }
            if (m_sink)
            {
                m_sink(r);
            }
        }

        // Called once the run has ended: a replay that stops short of the
        // expected trail has diverged too.
        void finish(SimInstant at)
        {
            if (m_hasExpected && !m_divergence && m_count != m_expected.size())
            {
                m_divergence = m_count;
                m_divergenceAt = at;
            }
        }

        std::uint64_t digest() const noexcept { return m_digest; }
        std::uint64_t count() const noexcept { return m_count; }
        const std::vector<TraceRecord> &records() const noexcept { return m_records; }

        std::optional<std::uint64_t> divergence() const noexcept { return m_divergence; }
        SimInstant divergence_at() const noexcept { return m_divergenceAt; }

    private:
        bool m_recording = false;
        bool m_hasExpected = false;
        std::uint64_t m_digest = 0;
        std::uint64_t m_count = 0;
        std::vector<TraceRecord> m_records;
        std::vector<TraceRecord> m_expected;
        std::optional<std::uint64_t> m_divergence;
        SimInstant m_divergenceAt = 0;
        std::function<void(const TraceRecord &)> m_sink;
    };
}
