#pragma once

#include "common.hpp"
#include "random.hpp"

#include <stdexcept>

namespace detsim
{
    enum class FaultKind : std::uint8_t
    {
        Partition = 1,
        Heal = 2,
        LatencyChange = 3,
        LossChange = 4,
        Crash = 5,
        Restart = 6,
        ClockSkew = 7,
    };

    inline const char *fault_kind_name(FaultKind k) noexcept
    {
        switch (k)
        {
        case FaultKind::Partition:
            return "partition";
        case FaultKind::Heal:
            return "heal";
        case FaultKind::LatencyChange:
            return "latency-change";
        case FaultKind::LossChange:
            return "loss-change";
        case FaultKind::Crash:
            return "crash";
        case FaultKind::Restart:
            return "restart";
        case FaultKind::ClockSkew:
            return "clock-skew";
        }
        return "unknown";
    }

    // A scheduled adversarial event. Link faults use (a, b); host faults use a.
    struct Fault
    {
        FaultKind kind = FaultKind::Partition;
        HostId a = 0;
        HostId b = 0;
        SimDuration minLatency = 0;
        SimDuration maxLatency = 0;
        double lossRate = 0.0;
        SimDuration skew = 0;

        static Fault partition(HostId a, HostId b) { return Fault{FaultKind::Partition, a, b}; }
        static Fault heal(HostId a, HostId b) { return Fault{FaultKind::Heal, a, b}; }

        static Fault latency_change(HostId a, HostId b, SimDuration minLatency, SimDuration maxLatency)
        {
            Fault f{FaultKind::LatencyChange, a, b};
            f.minLatency = minLatency;
            f.maxLatency = maxLatency;
            return f;
        }

        static Fault loss_change(HostId a, HostId b, double lossRate)
        {
            Fault f{FaultKind::LossChange, a, b};
            f.lossRate = lossRate;
            return f;
        }

        static Fault crash(HostId host) { return Fault{FaultKind::Crash, host}; }
        static Fault restart(HostId host) { return Fault{FaultKind::Restart, host}; }

        static Fault clock_skew(HostId host, SimDuration offset)
        {
            Fault f{FaultKind::ClockSkew, host};
            f.skew = offset;
            return f;
        }
    };

    inline std::string describe(const Fault &f)
    {
        std::string out = fault_kind_name(f.kind);
        switch (f.kind)
        {
        case FaultKind::Partition:
        case FaultKind::Heal:
            out += " hosts=" + std::to_string(f.a) + "<->" + std::to_string(f.b);
            break;
        case FaultKind::LatencyChange:
            out += " hosts=" + std::to_string(f.a) + "<->" + std::to_string(f.b) +
                   " range=[" + std::to_string(f.minLatency) + "," + std::to_string(f.maxLatency) + "]ns";
            break;
        case FaultKind::LossChange:
            out += " hosts=" + std::to_string(f.a) + "<->" + std::to_string(f.b) +
                   " rate=" + std::to_string(f.lossRate);
            break;
        case FaultKind::Crash:
        case FaultKind::Restart:
            out += " host=" + std::to_string(f.a);
            break;
        case FaultKind::ClockSkew:
            out += " host=" + std::to_string(f.a) + " offset=" + std::to_string(f.skew) + "ns";
            break;
        }
        return out;
    }

    struct ScheduledFault
    {
        SimInstant at = 0;
        std::uint64_t sequence = 0;
        Fault fault{};
    };

    // Time-ordered queue of faults. Ties at the same instant keep insertion order.
    class FaultScheduler
    {
    public:
        void schedule_at(SimInstant at, Fault fault)
        {
            const std::uint64_t seq = m_nextSeq++;
            m_pending.emplace(std::make_pair(at, seq), fault);
            m_history.push_back(ScheduledFault{at, seq, fault});
        }

        void schedule_after(SimInstant current, SimDuration delay, Fault fault)
        {
            schedule_at(instant_after(current, delay), fault);
        }

        // Removes and returns every fault due at or before `instant`.
        std::vector<ScheduledFault> due(SimInstant instant)
        {
            std::vector<ScheduledFault> out;
            while (!m_pending.empty() && m_pending.begin()->first.first <= instant)
            {
                auto it = m_pending.begin();
                out.push_back(ScheduledFault{it->first.first, it->first.second, it->second});
                m_pending.erase(it);
            }
            return out;
        }

        std::optional<SimInstant> next_instant() const
        {
            if (m_pending.empty())
            {
                return std::nullopt;
            }
            return m_pending.begin()->first.first;
        }

        std::size_t pending() const noexcept { return m_pending.size(); }

        // Everything ever scheduled, in scheduling order (for reproduction reports).
        const std::vector<ScheduledFault> &history() const noexcept { return m_history; }

    private:
        std::uint64_t m_nextSeq = 1;
        std::map<std::pair<SimInstant, std::uint64_t>, Fault> m_pending;
        std::vector<ScheduledFault> m_history;
    };

    // --- Chaos generation ---------------------------------------------------------

    struct ChaosConfig
    {
        // Number of fault episodes. Each episode is an onset and a recovery, so the
        // generated schedule holds twice as many entries.
        std::size_t faultCount = 8;

        // Episodes start and end inside [start, start + duration].
        SimInstant start = 0;
        SimDuration duration = seconds(10);

        std::vector<HostId> hosts;

        bool allowPartition = true;
        bool allowLatency = true;
        bool allowLoss = true;
        bool allowCrash = true;
        bool allowSkew = true;

        // Latency spikes draw a range inside [0, maxLatency].
        SimDuration maxLatency = millis(200);
        double maxLossRate = 0.5;
        SimDuration maxSkew = millis(500);

        // Link settings restored when a latency/loss episode ends.
        SimDuration baseMinLatency = millis(1);
        SimDuration baseMaxLatency = millis(1);
        double baseLossRate = 0.0;
    };

    struct TimedFault
    {
        SimInstant at = 0;
        Fault fault{};
    };

    // Produces a randomized but fully reproducible fault schedule. All draws come
    // from `rng`, so the result is a function of the stream state and `cfg`.
    inline std::vector<TimedFault> generate_chaos(EntropyStream &rng, const ChaosConfig &cfg)
    {
        if (cfg.duration <= 0)
        {
            throw std::invalid_argument("generate_chaos: duration must be positive");
        }
        if (cfg.hosts.empty())
        {
            throw std::invalid_argument("generate_chaos: no hosts");
        }

        std::vector<FaultKind> kinds;
        const bool linkFaults = cfg.hosts.size() >= 2;
        if (cfg.allowPartition && linkFaults)
        {
            kinds.push_back(FaultKind::Partition);
        }
        if (cfg.allowLatency && linkFaults)
        {
            kinds.push_back(FaultKind::LatencyChange);
        }
        if (cfg.allowLoss && linkFaults)
        {
            kinds.push_back(FaultKind::LossChange);
        }
        if (cfg.allowCrash)
        {
            kinds.push_back(FaultKind::Crash);
        }
        if (cfg.allowSkew)
        {
            kinds.push_back(FaultKind::ClockSkew);
        }
        if (kinds.empty())
        {
            throw std::invalid_argument("generate_chaos: no fault kind is enabled for this host set");
        }

        const auto window = static_cast<std::uint64_t>(cfg.duration);

        std::vector<TimedFault> out;
        out.reserve(cfg.faultCount * 2);
        for (std::size_t i = 0; i < cfg.faultCount; ++i)
        {
            const FaultKind kind = rng.choose(kinds);
            const std::uint64_t onset = rng.next_range(0, window - 1);
            const std::uint64_t recovery = rng.next_range(onset + 1, window);
            const SimInstant begin = instant_after(cfg.start, static_cast<SimDuration>(onset));
            const SimInstant end = instant_after(cfg.start, static_cast<SimDuration>(recovery));

            const HostId a = rng.choose(cfg.hosts);
            HostId b = a;
            if (linkFaults)
            {
                // Pick a distinct peer by offsetting into the remaining hosts.
                const std::size_t ai = static_cast<std::size_t>(std::find(cfg.hosts.begin(), cfg.hosts.end(), a) - cfg.hosts.begin());
                const std::size_t off = 1 + rng.choose_index(cfg.hosts.size() - 1);
                b = cfg.hosts[(ai + off) % cfg.hosts.size()];
            }

            switch (kind)
            {
            case FaultKind::Partition:
                out.push_back(TimedFault{begin, Fault::partition(a, b)});
                out.push_back(TimedFault{end, Fault::heal(a, b)});
                break;
            case FaultKind::LatencyChange:
            {
                const auto hi = static_cast<SimDuration>(rng.next_range(0, static_cast<std::uint64_t>(cfg.maxLatency)));
                const auto lo = static_cast<SimDuration>(rng.next_range(0, static_cast<std::uint64_t>(hi)));
                out.push_back(TimedFault{begin, Fault::latency_change(a, b, lo, hi)});
                out.push_back(TimedFault{end, Fault::latency_change(a, b, cfg.baseMinLatency, cfg.baseMaxLatency)});
                break;
            }
            case FaultKind::LossChange:
                out.push_back(TimedFault{begin, Fault::loss_change(a, b, rng.next_unit() * cfg.maxLossRate)});
                out.push_back(TimedFault{end, Fault::loss_change(a, b, cfg.baseLossRate)});
                break;
            case FaultKind::Crash:
                out.push_back(TimedFault{begin, Fault::crash(a)});
                out.push_back(TimedFault{end, Fault::restart(a)});
                break;
            case FaultKind::ClockSkew:
                out.push_back(TimedFault{begin, Fault::clock_skew(a, rng.next_range_signed(-cfg.maxSkew, cfg.maxSkew))});
                out.push_back(TimedFault{end, Fault::clock_skew(a, 0)});
                break;
            case FaultKind::Heal:
            case FaultKind::Restart:
                break;
            }
        }

        std::stable_sort(out.begin(), out.end(), [](const TimedFault &x, const TimedFault &y)
                         { return x.at < y.at; });
        return out;
    }
}
