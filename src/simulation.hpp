#pragma once

#include "clock.hpp"
#include "context.hpp"
#include "executor.hpp"
#include "fault.hpp"
#include "log.hpp"
#include "network.hpp"
#include "random.hpp"
#include "task.hpp"
#include "trace.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string_view>

namespace detsim
{
    struct SimulationConfig
    {
        // Master seed. Every entropy stream, and through them every latency, loss
        // and chaos decision, derives from this value.
        std::uint64_t seed = 1;

        // Link settings for every host pair without an explicit override.
        LinkConfig defaultLink{};

        // Optional ceiling on simulated time (measured from the start of the run).
        // Reaching it ends the run with RunOutcome::Timeout.
        std::optional<SimDuration> maxDuration;

        // Optional ceiling on run-loop iterations, for hosts that spin on
        // zero-delay timers without ever letting time move.
        std::optional<std::uint64_t> maxSteps;

        // Stop the run at the first task failure instead of recording it and
        // carrying on.
        bool failFast = false;

        // Keep every trail record in memory (RunReport::trail). The digest is
        // computed either way.
        bool recordTrail = false;

        // Optional replay oracle: the run stops with RunOutcome::ReplayDivergence
        // at the first record that differs from this trail.
        std::optional<std::vector<TraceRecord>> expectedTrail;

        // Optional observer for each trail record as it is produced.
        std::function<void(const TraceRecord &)> traceSink;

        // The Logger is shared by every simulation in the process. A run only
        // sets its level when asked to; unset leaves the current level alone.
        std::optional<LogLevel> logLevel;

        // Enable extra runtime invariant checks (throws on violation).
#if defined(DETSIM_ENABLE_INVARIANT_CHECKS_DEFAULT)
        bool enableInvariantChecks = (DETSIM_ENABLE_INVARIANT_CHECKS_DEFAULT != 0);
#else
        bool enableInvariantChecks = false;
#endif
    };

    // Reads a seed override from the environment (e.g. DETSIM_SEED=1234) so a
    // failing run can be reproduced without touching the test.
    inline std::uint64_t seed_from_env(const char *name, std::uint64_t fallback)
    {
        const char *raw = std::getenv(name);
        if (!raw || *raw == '\0')
        {
            return fallback;
        }
        char *end = nullptr;
        const unsigned long long v = std::strtoull(raw, &end, 0);
        if (end == raw || *end != '\0')
        {
            throw std::invalid_argument(std::string("seed_from_env: ") + name + " is not an integer: '" + raw + "'");
        }
        return static_cast<std::uint64_t>(v);
    }

    enum class RunOutcome : std::uint8_t
    {
        Completed = 0,
        Deadlock = 1,
        Timeout = 2,
        TaskFailed = 3,
        ReplayDivergence = 4,
    };

    inline const char *run_outcome_name(RunOutcome o) noexcept
    {
        switch (o)
        {
        case RunOutcome::Completed:
            return "completed";
        case RunOutcome::Deadlock:
            return "deadlock";
        case RunOutcome::Timeout:
            return "timeout";
        case RunOutcome::TaskFailed:
            return "task-failed";
        case RunOutcome::ReplayDivergence:
            return "replay-divergence";
        }
        return "unknown";
    }

    struct RunReport
    {
        RunOutcome outcome = RunOutcome::Completed;
        std::uint64_t seed = 0;
        SimInstant finalInstant = 0;

        // Where the run went wrong: deadlock/timeout instant, first task failure,
        // or the point of replay divergence.
        std::optional<SimInstant> failureInstant;

        std::vector<ScheduledFault> faultSchedule;
        std::vector<ScheduledFault> appliedFaults;
        std::vector<TaskFailure> failures;
        std::map<HostId, std::string> hostNames;

        std::uint64_t traceDigest = 0;
        std::uint64_t traceCount = 0;
        std::optional<std::uint64_t> divergenceIndex;
        std::vector<TraceRecord> trail;

        NetworkStats network{};
        std::uint64_t timersFired = 0;
        std::uint64_t steps = 0;
        std::uint64_t tasksCompleted = 0;
        std::uint64_t tasksCancelled = 0;
        std::size_t tasksRemaining = 0;

        bool ok() const noexcept { return outcome == RunOutcome::Completed && failures.empty(); }

        // Everything needed to reproduce the run: seed, outcome and instant,
        // the full fault schedule and the failures.
        std::string describe() const
        {
            std::string out = "detsim run: outcome=" + std::string(run_outcome_name(outcome)) +
                              " seed=" + std::to_string(seed) +
                              " final_t=" + std::to_string(finalInstant) + "ns";
            if (failureInstant)
            {
                out += " failure_t=" + std::to_string(*failureInstant) + "ns";
            }
            out += "\n  reproduce with DETSIM_SEED=" + std::to_string(seed) + "\n";
            if (divergenceIndex)
            {
                out += "  replay diverged at trail record #" + std::to_string(*divergenceIndex) + "\n";
            }

            out += "  fault schedule (" + std::to_string(faultSchedule.size()) + "):\n";
            for (const auto &f : faultSchedule)
            {
                out += "    t=" + std::to_string(f.at) + "ns " + describe_fault_(f.fault) + "\n";
            }
            out += "  applied faults (" + std::to_string(appliedFaults.size()) + "):\n";
            for (const auto &f : appliedFaults)
            {
                out += "    t=" + std::to_string(f.at) + "ns " + describe_fault_(f.fault) + "\n";
            }

            out += "  task failures (" + std::to_string(failures.size()) + "):\n";
            for (const auto &f : failures)
            {
                out += "    t=" + std::to_string(f.at) + "ns host=" + host_label_(f.host) +
                       " task=" + std::to_string(f.task) + " (" + f.taskName + "): " + f.message + "\n";
            }
            out += "  trail: records=" + std::to_string(traceCount) + " digest=" + std::to_string(traceDigest) + "\n";
            return out;
        }

        void throw_if_failed() const;

    private:
        std::string host_label_(HostId h) const
        {
            auto it = hostNames.find(h);
            return (it == hostNames.end()) ? std::to_string(h) : it->second + "(" + std::to_string(h) + ")";
        }

        std::string describe_fault_(const Fault &f) const
        {
            std::string out = detsim::describe(f);
            out += " [" + host_label_(f.a);
            if (f.kind == FaultKind::Partition || f.kind == FaultKind::Heal ||
                f.kind == FaultKind::LatencyChange || f.kind == FaultKind::LossChange)
            {
                out += "," + host_label_(f.b);
            }
            return out + "]";
        }
    };

    class SimulationError : public std::runtime_error
    {
    public:
        SimulationError(RunOutcome outcome, const std::string &what)
            : std::runtime_error(what), m_outcome(outcome)
        {
        }

        RunOutcome outcome() const noexcept { return m_outcome; }

    private:
        RunOutcome m_outcome;
    };

    inline void RunReport::throw_if_failed() const
    {
        if (ok())
        {
            return;
        }
        throw SimulationError(outcome == RunOutcome::Completed ? RunOutcome::TaskFailed : outcome, describe());
    }

    // The orchestrator. Owns the clock, network, entropy, fault queue and
    // executor of one simulated universe; independent instances share nothing.
    //
    // Each iteration drains every ready task (zero simulated time), then moves
    // the clock to the earliest pending event and applies, in order: due faults,
    // due message deliveries, due timers.
    class Simulation final
    {
    public:
        explicit Simulation(SimulationConfig cfg)
            : m_cfg(std::move(cfg)),
              m_entropy(m_cfg.seed),
              m_network(m_clock, m_entropy, m_trail, m_cfg.defaultLink),
              m_executor(m_clock, m_trail)
        {
            if (m_cfg.logLevel)
            {
                Logger::instance().set_level(*m_cfg.logLevel);
            }

            m_trail.set_recording(m_cfg.recordTrail);
            if (m_cfg.traceSink)
            {
                m_trail.set_sink(m_cfg.traceSink);
            }
            if (m_cfg.expectedTrail)
            {
                m_trail.set_expected(*m_cfg.expectedTrail);
            }

            m_network.set_waker([this](TaskId t)
                                { m_executor.wake(t); });
            m_executor.set_release_hook([this](TaskId t)
                                        {
                m_clock.cancel_owned(t);
                m_network.forget_waiter(t); });
            m_executor.set_stop_on_failure(m_cfg.failFast);
        }

        Simulation(const Simulation &) = delete;
        Simulation &operator=(const Simulation &) = delete;

        // --- Hosts -----------------------------------------------------------------

        // A server-like host. Runs until it finishes, crashes, or the run ends.
        HostId add_host(std::string name, HostEntry entry)
        {
            return add_host_(std::move(name), std::move(entry), false);
        }

        // A client host. Once any client is registered, the run completes as soon
        // as every client task has finished, whatever the other hosts are doing.
        HostId add_client(std::string name, HostEntry entry)
        {
            m_hasClients = true;
            return add_host_(std::move(name), std::move(entry), true);
        }

        // Additional entry point for an existing host (restarts re-run all of them).
        void add_host_task(HostId host, HostEntry entry)
        {
            if (!entry)
            {
                throw std::runtime_error("add_host_task: null entry");
            }
            auto &rec = host_(host);
            rec.entries.push_back(entry);
            if (m_started && !rec.crashed)
            {
                m_executor.spawn(host, make_entry_task_(entry), rec.client);
            }
        }

        HostId host_id(std::string_view name) const
        {
            const auto id = m_network.resolve(name);
            if (!id)
            {
                throw std::runtime_error("Simulation: unknown host '" + std::string(name) + "'");
            }
            return *id;
        }

        const std::string &host_name(HostId host) const { return m_network.host_name(host); }

        bool crashed(HostId host) const { return host_(host).crashed; }

        // --- Fault control -----------------------------------------------------------

        void partition(HostId a, HostId b)
        {
            apply_fault_(Fault::partition(a, b));
        }

        void repair(HostId a, HostId b)
        {
            apply_fault_(Fault::heal(a, b));
        }

        void partition(std::string_view a, std::string_view b) { partition(host_id(a), host_id(b)); }
        void repair(std::string_view a, std::string_view b) { repair(host_id(a), host_id(b)); }

        // Splits two groups: every cross pair is partitioned.
        void partition_groups(const std::vector<HostId> &left, const std::vector<HostId> &right)
        {
            for (HostId a : left)
            {
                for (HostId b : right)
                {
                    partition(a, b);
                }
            }
        }

        void repair_groups(const std::vector<HostId> &left, const std::vector<HostId> &right)
        {
            for (HostId a : left)
            {
                for (HostId b : right)
                {
                    repair(a, b);
                }
            }
        }

        // Cuts `host` off from every other registered host.
        void isolate(HostId host)
        {
            (void)host_(host);
            for (const auto &[id, rec] : m_hosts)
            {
                (void)rec;
                if (id != host)
                {
                    partition(host, id);
                }
            }
        }

        void set_link_latency(HostId a, HostId b, SimDuration minLatency, SimDuration maxLatency)
        {
            apply_fault_(Fault::latency_change(a, b, minLatency, maxLatency));
        }

        void set_link_loss(HostId a, HostId b, double lossRate)
        {
            apply_fault_(Fault::loss_change(a, b, lossRate));
        }

        void crash(HostId host) { apply_fault_(Fault::crash(host)); }
        void restart(HostId host) { apply_fault_(Fault::restart(host)); }

        // An instant already in the past means "at the next advance".
        void schedule_fault_at(SimInstant at, Fault fault)
        {
            validate_fault_(fault);
            m_faults.schedule_at(std::max(at, m_clock.now()), fault);
        }

        void schedule_fault_after(SimDuration delay, Fault fault)
        {
            validate_fault_(fault);
            m_faults.schedule_after(m_clock.now(), delay, fault);
        }

        // Generates a chaos schedule from the runtime's own entropy stream and
        // queues it. Returns the number of faults scheduled.
        std::size_t schedule_chaos(ChaosConfig chaos)
        {
            if (chaos.hosts.empty())
            {
                for (const auto &[id, rec] : m_hosts)
                {
                    (void)rec;
                    chaos.hosts.push_back(id);
                }
            }
            const auto planned = generate_chaos(m_entropy.stream_for(RuntimeHost, "chaos"), chaos);
            for (const auto &tf : planned)
            {
                schedule_fault_at(tf.at, tf.fault);
            }
            return planned.size();
        }

        // --- Run control -----------------------------------------------------------

        // One iteration of the run loop. Returns false once the run has ended.
        bool step()
        {
            if (m_outcome)
            {
                return false;
            }
            start_if_needed_();
            ++m_steps;

            drain_();

            if (m_cfg.failFast && !m_executor.failures().empty())
            {
                return finish_(RunOutcome::TaskFailed, m_executor.failures().front().at);
            }
            if (m_trail.divergence())
            {
                return finish_(RunOutcome::ReplayDivergence, m_trail.divergence_at());
            }
            if (work_finished_())
            {
                return finish_(RunOutcome::Completed, std::nullopt);
            }
            if (m_cfg.maxSteps && m_steps >= *m_cfg.maxSteps)
            {
                Logger::instance().logf(LogLevel::Warn, RuntimeHost, m_clock.now(), "step ceiling reached after %llu steps",
                                        static_cast<unsigned long long>(m_steps));
                return finish_(RunOutcome::Timeout, m_clock.now());
            }

            const auto next = next_event_instant_();
            if (!next)
            {
                Logger::instance().logf(LogLevel::Warn, RuntimeHost, m_clock.now(), "deadlock: %zu task(s) suspended with nothing pending",
                                        m_executor.live());
                return finish_(RunOutcome::Deadlock, m_clock.now());
            }

            if (m_cfg.maxDuration)
            {
                const SimInstant ceiling = instant_after(0, *m_cfg.maxDuration);
                if (*next > ceiling)
                {
                    if (ceiling > m_clock.now())
                    {
                        advance_(ceiling);
                    }
                    Logger::instance().logf(LogLevel::Warn, RuntimeHost, m_clock.now(), "run ceiling reached");
                    return finish_(RunOutcome::Timeout, m_clock.now());
                }
            }

            advance_(*next);
            validate_invariants_("step:advance");
            return true;
        }

        RunReport run()
        {
            while (step())
            {
            }
            return report();
        }

        bool finished() const noexcept { return m_outcome.has_value(); }

        RunReport report() const
        {
            RunReport r;
            r.outcome = m_outcome.value_or(RunOutcome::Completed);
            r.seed = m_cfg.seed;
            r.finalInstant = m_clock.now();
            r.failureInstant = m_failureInstant;
            r.faultSchedule = m_faults.history();
            r.appliedFaults = m_applied;
            r.failures = m_executor.failures();
            for (const auto &[id, rec] : m_hosts)
            {
                r.hostNames.emplace(id, rec.name);
            }
            r.traceDigest = m_trail.digest();
            r.traceCount = m_trail.count();
            r.divergenceIndex = m_trail.divergence();
            r.trail = m_trail.records();
            r.network = m_network.stats();
            r.timersFired = m_timersFired;
            r.steps = m_steps;
            r.tasksCompleted = m_executor.completed();
            r.tasksCancelled = m_executor.cancelled();
            r.tasksRemaining = m_executor.live();
            return r;
        }

        SimInstant now() const noexcept { return m_clock.now(); }
        std::uint64_t seed() const noexcept { return m_cfg.seed; }

        VirtualClock &clock() noexcept { return m_clock; }
        SimNetwork &network() noexcept { return m_network; }
        EntropyManager &entropy() noexcept { return m_entropy; }
        Executor &executor() noexcept { return m_executor; }
        const EventTrail &trail() const noexcept { return m_trail; }
        const FaultScheduler &faults() const noexcept { return m_faults; }

    private:
        struct HostRecord
        {
            std::string name;
            std::vector<HostEntry> entries;
            bool client = false;
            bool crashed = false;
        };

        HostId add_host_(std::string name, HostEntry entry, bool client)
        {
            if (!entry)
            {
                throw std::runtime_error("add_host: null entry for '" + name + "'");
            }
            if (name.empty() || name.find(':') != std::string::npos)
            {
                throw std::runtime_error("add_host: host names must be non-empty and must not contain ':'");
            }
            const HostId id = m_nextHost++;
            m_network.register_host(id, name);

            HostRecord rec;
            rec.name = std::move(name);
            rec.entries.push_back(entry);
            rec.client = client;
            m_hosts.emplace(id, std::move(rec));

            if (m_started)
            {
                m_executor.spawn(id, make_entry_task_(entry), client);
            }
            return id;
        }

        HostRecord &host_(HostId host)
        {
            auto it = m_hosts.find(host);
            if (it == m_hosts.end())
            {
                throw std::runtime_error("Simulation: unknown HostId=" + std::to_string(host));
            }
            return it->second;
        }

        const HostRecord &host_(HostId host) const
        {
            auto it = m_hosts.find(host);
            if (it == m_hosts.end())
            {
                throw std::runtime_error("Simulation: unknown HostId=" + std::to_string(host));
            }
            return it->second;
        }

        static std::unique_ptr<ITask> make_entry_task_(const HostEntry &entry)
        {
            auto task = entry();
            if (!task)
            {
                throw std::runtime_error("host entry returned a null task");
            }
            return task;
        }

        void start_if_needed_()
        {
            if (m_started)
            {
                return;
            }
            m_started = true;
            for (const auto &[id, rec] : m_hosts)
            {
                spawn_entries_(id, rec);
            }
        }

        void spawn_entries_(HostId id, const HostRecord &rec)
        {
            for (const auto &entry : rec.entries)
            {
                m_executor.spawn(id, make_entry_task_(entry), rec.client);
            }
        }

        void drain_()
        {
            const SimServices services{m_clock, m_entropy, m_network, m_executor};
            m_executor.drain([&](TaskId id, HostId host, ITask &task, bool first)
                             {
                HostContext ctx(services, host, id);
                if (first)
                {
                    task.on_start(ctx);
                }
                return task.resume(ctx); });
        }

        bool work_finished_() const
        {
            if (m_hasClients)
            {
                return m_executor.live_foreground() == 0;
            }
            return m_executor.live() == 0;
        }

        std::optional<SimInstant> next_event_instant_() const
        {
            std::optional<SimInstant> next;
            const auto consider = [&](std::optional<SimInstant> t)
            {
                if (t && (!next || *t < *next))
                {
                    next = t;
                }
            };
            consider(m_clock.next_deadline());
            consider(m_network.next_delivery());
            consider(m_faults.next_instant());
            return next;
        }

        void advance_(SimInstant to)
        {
            const auto fired = m_clock.advance_to(to);

            for (const auto &sf : m_faults.due(to))
            {
                apply_fault_(sf.fault);
            }

            m_network.deliver_due(to);

            for (const auto &t : fired)
            {
                // The owner may have been cancelled by a crash at this instant.
                const auto host = m_executor.host_of(t.owner);
                if (!host)
                {
                    continue;
                }
                ++m_timersFired;
                m_trail.record(TraceRecord{to, TraceKind::TimerFire, *host, 0, t.handle, t.owner});
                m_executor.wake(t.owner);
            }
        }

        void validate_fault_(const Fault &f) const
        {
            (void)host_(f.a);
            switch (f.kind)
            {
            case FaultKind::Partition:
            case FaultKind::Heal:
            case FaultKind::LatencyChange:
            case FaultKind::LossChange:
                (void)host_(f.b);
                break;
            default:
                break;
            }
            if (f.kind == FaultKind::LatencyChange && (f.minLatency < 0 || f.maxLatency < f.minLatency))
            {
                throw std::invalid_argument("LatencyChange: latency range must satisfy 0 <= min <= max");
            }
            if (f.kind == FaultKind::LossChange && !(f.lossRate >= 0.0 && f.lossRate <= 1.0))
            {
                throw std::invalid_argument("LossChange: loss rate must be within [0, 1]");
            }
        }

        void apply_fault_(const Fault &f)
        {
            validate_fault_(f);
            const SimInstant now = m_clock.now();

            switch (f.kind)
            {
            case FaultKind::Partition:
                m_network.partition(f.a, f.b);
                break;
            case FaultKind::Heal:
                m_network.repair(f.a, f.b);
                break;
            case FaultKind::LatencyChange:
                m_network.set_link_latency(f.a, f.b, f.minLatency, f.maxLatency);
                break;
            case FaultKind::LossChange:
                m_network.set_link_loss(f.a, f.b, f.lossRate);
                break;
            case FaultKind::Crash:
                crash_host_(f.a);
                break;
            case FaultKind::Restart:
                restart_host_(f.a);
                break;
            case FaultKind::ClockSkew:
                m_clock.set_skew(f.a, f.skew);
                break;
            }

            // Scheduled and direct faults alike; the sequence is the order of application.
            m_applied.push_back(ScheduledFault{now, static_cast<std::uint64_t>(m_applied.size()), f});
            m_trail.record(TraceRecord{now, TraceKind::Fault, f.a, f.b, static_cast<std::uint64_t>(f.kind), static_cast<std::uint64_t>(f.skew)});
            if (Logger::instance().enabled(LogLevel::Info))
            {
                Logger::instance().logf(LogLevel::Info, f.a, now, "fault applied: %s", describe(f).c_str());
            }
        }

        void crash_host_(HostId host)
        {
            auto &rec = host_(host);
            if (rec.crashed)
            {
                return;
            }
            rec.crashed = true;
            m_executor.cancel_host(host);
            m_network.crash_host(host);
        }

        // A restart of a live host first crashes it: the new incarnation never
        // sees the old one's memory, sockets or timers.
        void restart_host_(HostId host)
        {
            crash_host_(host);
            auto &rec = host_(host);
            rec.crashed = false;
            if (m_started)
            {
                spawn_entries_(host, rec);
            }
        }

        bool finish_(RunOutcome outcome, std::optional<SimInstant> failureAt)
        {
            m_outcome = outcome;
            m_failureInstant = failureAt;
            if (outcome == RunOutcome::Completed && !m_executor.failures().empty())
            {
                m_failureInstant = m_executor.failures().front().at;
            }
            m_trail.finish(m_clock.now());
            if (outcome == RunOutcome::Completed && m_trail.divergence())
            {
                m_outcome = RunOutcome::ReplayDivergence;
                m_failureInstant = m_trail.divergence_at();
            }
            Logger::instance().logf(outcome == RunOutcome::Completed ? LogLevel::Info : LogLevel::Error, RuntimeHost, m_clock.now(),
                                    "run finished: %s (seed=%llu)", run_outcome_name(*m_outcome),
                                    static_cast<unsigned long long>(m_cfg.seed));
            return false;
        }

        void invariant_or_throw_(bool ok, const char *msg) const
        {
            if (!ok)
            {
                throw std::logic_error(msg);
            }
        }

        void validate_invariants_(const char *where) const
        {
            if (!m_cfg.enableInvariantChecks)
            {
                return;
            }
            invariant_or_throw_(m_executor.ready_queue_consistent(), "invariant: ready queue holds a task that is not ready");

            const auto next = next_event_instant_();
            invariant_or_throw_(!next || *next >= m_clock.now(), "invariant: pending event scheduled in the past");

            if (const auto d = m_clock.next_deadline())
            {
                invariant_or_throw_(*d > m_clock.now(), "invariant: due timer left unfired after advance");
            }
            if (const auto d = m_network.next_delivery())
            {
                invariant_or_throw_(*d > m_clock.now(), "invariant: due message left undelivered after advance");
            }
            (void)where;
        }

        SimulationConfig m_cfg;

        VirtualClock m_clock;
        EventTrail m_trail;
        EntropyManager m_entropy;
        SimNetwork m_network;
        Executor m_executor;
        FaultScheduler m_faults;

        std::map<HostId, HostRecord> m_hosts;
        HostId m_nextHost = 1;
        bool m_hasClients = false;
        bool m_started = false;

        std::vector<ScheduledFault> m_applied;
        std::optional<RunOutcome> m_outcome;
        std::optional<SimInstant> m_failureInstant;
        std::uint64_t m_timersFired = 0;
        std::uint64_t m_steps = 0;
    };
}
