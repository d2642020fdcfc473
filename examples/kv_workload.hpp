#pragma once

// A tiny line-oriented key-value service and a client that checks
// read-your-writes against it. Used by the chaos and seed-sweep examples.
//
// Wire format, one request or reply per line:
//   "<id> PUT <key> <value>"  ->  "<id> OK"
//   "<id> GET <key>"          ->  "<id> VAL <value>" | "<id> NONE"

#include "context.hpp"
#include "simulation.hpp"
#include "task.hpp"

#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace kv
{
    constexpr std::uint16_t Port = 7000;

    // Stable storage. Owned by the host factory, so it outlives crashes.
    struct Disk
    {
        std::map<std::string, std::string> data;
        std::uint64_t writes = 0;
    };

    struct ClientStats
    {
        std::uint64_t completedOps = 0;
        std::uint64_t retries = 0;
        std::uint64_t reconnects = 0;
        std::uint64_t gaveUp = 0;
    };

    class LineBuffer
    {
    public:
        void append(const detsim::ByteBuffer &bytes) { m_pending += detsim::string_of(bytes); }

        std::optional<std::string> next()
        {
            const auto nl = m_pending.find('\n');
            if (nl == std::string::npos)
            {
                return std::nullopt;
            }
            std::string line = m_pending.substr(0, nl);
            m_pending.erase(0, nl + 1);
            return line;
        }

        void clear() { m_pending.clear(); }

    private:
        std::string m_pending;
    };

    class Session final : public detsim::ITask
    {
    public:
        Session(detsim::ConnectionId conn, std::shared_ptr<Disk> disk) : m_conn(conn), m_recv(conn), m_disk(std::move(disk)) {}

        detsim::TaskPoll resume(detsim::HostContext &ctx) override
        {
            while (true)
            {
                if (!m_recv.poll(ctx))
                {
                    return detsim::TaskPoll::Pending;
                }
                if (m_recv.error() != detsim::NetError::None)
                {
                    ctx.close(m_conn);
                    return detsim::TaskPoll::Done;
                }
                m_lines.append(m_recv.data());
                m_recv.reset();

                while (auto line = m_lines.next())
                {
                    // Replies that cannot be sent are the client's to retry.
                    (void)ctx.send(m_conn, handle_(*line) + "\n");
                }
            }
        }

        std::string name() const override { return "kv-session"; }

    private:
        std::string handle_(const std::string &line)
        {
            std::istringstream in(line);
            std::string id;
            std::string op;
            std::string key;
            in >> id >> op >> key;

            if (op == "PUT")
            {
                std::string value;
                in >> value;
                m_disk->data[key] = value;
                ++m_disk->writes;
                return id + " OK";
            }
            if (op == "GET")
            {
                auto it = m_disk->data.find(key);
                return (it == m_disk->data.end()) ? id + " NONE" : id + " VAL " + it->second;
            }
            return id + " ERR";
        }

        detsim::ConnectionId m_conn = 0;
        detsim::RecvOp m_recv;
        LineBuffer m_lines;
        std::shared_ptr<Disk> m_disk;
    };

    class Server final : public detsim::ITask
    {
    public:
        explicit Server(std::shared_ptr<Disk> disk) : m_disk(std::move(disk)) {}

        void on_start(detsim::HostContext &ctx) override
        {
            const auto r = ctx.bind(Port);
            if (!r.ok())
            {
                throw std::runtime_error(std::string("kv bind: ") + detsim::net_error_name(r.error));
            }
            m_accept.emplace(r.value);
            ctx.log(detsim::LogLevel::Info, "kv server listening");
        }

        detsim::TaskPoll resume(detsim::HostContext &ctx) override
        {
            while (true)
            {
                if (!m_accept->poll(ctx))
                {
                    return detsim::TaskPoll::Pending;
                }
                if (m_accept->error() != detsim::NetError::None)
                {
                    return detsim::TaskPoll::Done;
                }
                ctx.spawn(std::make_unique<Session>(m_accept->connection(), m_disk));
                m_accept->reset();
            }
        }

        std::string name() const override { return "kv-server"; }

    private:
        std::shared_ptr<Disk> m_disk;
        std::optional<detsim::AcceptOp> m_accept;
    };

    // With `durable` the data survives crashes; without it every incarnation
    // starts from an empty store.
    inline detsim::HostEntry server(bool durable)
    {
        auto disk = std::make_shared<Disk>();
        return [disk, durable]()
        {
            return std::make_unique<Server>(durable ? disk : std::make_shared<Disk>());
        };
    }

    // Writes its own keys and reads each one back. A read that does not return
    // the last acknowledged write fails the task.
    class Client final : public detsim::ITask
    {
    public:
        Client(int rounds, ClientStats *stats) : m_rounds(rounds), m_stats(stats) {}

        detsim::TaskPoll resume(detsim::HostContext &ctx) override
        {
            while (true)
            {
                switch (m_phase)
                {
                case Phase::Connect:
                    if (!m_connect)
                    {
                        m_connect.emplace(detsim::Address{"kv", Port});
                    }
                    if (!m_connect->poll(ctx))
                    {
                        return detsim::TaskPoll::Pending;
                    }
                    if (m_connect->error() != detsim::NetError::None)
                    {
                        m_connect.reset();
                        if (!retry_(ctx, Phase::Connect))
                        {
                            return detsim::TaskPoll::Done;
                        }
                        break;
                    }
                    m_conn = m_connect->connection();
                    m_connect.reset();
                    m_lines.clear();
                    m_phase = Phase::Send;
                    break;

                case Phase::Send:
                {
                    if (m_op >= 2 * m_rounds)
                    {
                        ctx.close(m_conn);
                        return detsim::TaskPoll::Done;
                    }
                    const detsim::NetError err = ctx.send(m_conn, request_(ctx));
                    if (err == detsim::NetError::ConnectionClosed)
                    {
                        reconnect_(ctx);
                        if (!retry_(ctx, Phase::Connect))
                        {
                            return detsim::TaskPoll::Done;
                        }
                        break;
                    }
                    m_wait.emplace(detsim::RecvOp(m_conn), Patience);
                    m_phase = Phase::Wait;
                    break;
                }

                case Phase::Wait:
                    if (!m_wait->poll(ctx))
                    {
                        return detsim::TaskPoll::Pending;
                    }
                    if (m_wait->timed_out())
                    {
                        m_wait.reset();
                        if (!retry_(ctx, Phase::Send))
                        {
                            return detsim::TaskPoll::Done;
                        }
                        break;
                    }
                    if (m_wait->inner().error() != detsim::NetError::None)
                    {
                        m_wait.reset();
                        reconnect_(ctx);
                        if (!retry_(ctx, Phase::Connect))
                        {
                            return detsim::TaskPoll::Done;
                        }
                        break;
                    }
                    m_lines.append(m_wait->inner().data());
                    if (consume_replies_(ctx))
                    {
                        m_wait.reset();
                        ++m_op;
                        ++m_stats->completedOps;
                        m_attempts = 0;
                        m_phase = Phase::Send;
                    }
                    else
                    {
                        // Only stale replies so far: keep waiting under a fresh deadline.
                        m_wait.emplace(detsim::RecvOp(m_conn), Patience);
                    }
                    break;

                case Phase::Backoff:
                    if (!m_backoff.poll(ctx))
                    {
                        return detsim::TaskPoll::Pending;
                    }
                    m_phase = m_afterBackoff;
                    break;
                }
            }
        }

        std::string name() const override { return "kv-client"; }

    private:
        enum class Phase
        {
            Connect,
            Send,
            Wait,
            Backoff,
        };

        static constexpr detsim::SimDuration Patience = detsim::millis(250);
        static constexpr int MaxAttempts = 8;

        std::string key_(detsim::HostContext &ctx) const
        {
            return ctx.host_name() + "/k" + std::to_string((m_op / 2) % 3);
        }

        std::string value_(detsim::HostContext &ctx) const
        {
            return ctx.host_name() + "-v" + std::to_string(m_op / 2);
        }

        std::string request_(detsim::HostContext &ctx) const
        {
            const std::string id = std::to_string(m_op);
            if (m_op % 2 == 0)
            {
                return id + " PUT " + key_(ctx) + " " + value_(ctx) + "\n";
            }
            return id + " GET " + key_(ctx) + "\n";
        }

        // True once the reply to the current request has been read.
        bool consume_replies_(detsim::HostContext &ctx)
        {
            while (auto line = m_lines.next())
            {
                std::istringstream in(*line);
                std::string id;
                std::string status;
                std::string value;
                in >> id >> status >> value;
                if (id != std::to_string(m_op))
                {
                    continue;
                }
                if (m_op % 2 == 0)
                {
                    if (status != "OK")
                    {
                        throw std::runtime_error("kv: PUT rejected: " + *line);
                    }
                    return true;
                }
                const std::string expected = value_(ctx);
                if (status != "VAL" || value != expected)
                {
                    throw std::runtime_error("kv: read-your-writes violated for " + key_(ctx) +
                                             ": expected " + expected + ", got '" + *line + "'");
                }
                return true;
            }
            return false;
        }

        void reconnect_(detsim::HostContext &ctx)
        {
            ctx.close(m_conn);
            m_conn = 0;
            ++m_stats->reconnects;
        }

        // Counts an attempt and backs off with jitter before `next`.
        bool retry_(detsim::HostContext &ctx, Phase next)
        {
            if (++m_attempts > MaxAttempts)
            {
                ++m_stats->gaveUp;
                ctx.log(detsim::LogLevel::Warn, "kv client giving up");
                return false;
            }
            ++m_stats->retries;
            m_backoff.reset(static_cast<detsim::SimDuration>(ctx.entropy("backoff").next_range(detsim::millis(10), detsim::millis(100))));
            m_afterBackoff = next;
            m_phase = Phase::Backoff;
            return true;
        }

        int m_rounds = 0;
        int m_op = 0;
        int m_attempts = 0;
        Phase m_phase = Phase::Connect;
        Phase m_afterBackoff = Phase::Connect;

        std::optional<detsim::ConnectOp> m_connect;
        detsim::ConnectionId m_conn = 0;
        std::optional<detsim::Timeout<detsim::RecvOp>> m_wait;
        detsim::SleepOp m_backoff{0};
        LineBuffer m_lines;
        ClientStats *m_stats = nullptr;
    };

    struct Scenario
    {
        int clients = 3;
        int rounds = 20;
        bool durable = true;
        std::size_t faults = 6;
        std::optional<detsim::LogLevel> logLevel;
    };

    struct Result
    {
        detsim::RunReport report;
        ClientStats stats;
    };

    // One complete run of the workload under a chaos schedule drawn from `seed`.
    inline Result run_scenario(std::uint64_t seed, const Scenario &sc)
    {
        detsim::SimulationConfig cfg;
        cfg.seed = seed;
        cfg.defaultLink = detsim::LinkConfig{detsim::millis(1), detsim::millis(20), 0.02};
        cfg.maxDuration = detsim::seconds(120);
        cfg.logLevel = sc.logLevel;

        Result out;
        detsim::Simulation sim(cfg);
        const detsim::HostId kvHost = sim.add_host("kv", server(sc.durable));
        for (int i = 0; i < sc.clients; ++i)
        {
            ClientStats *stats = &out.stats;
            const int rounds = sc.rounds;
            (void)sim.add_client("client-" + std::to_string(i), [stats, rounds]()
                                 { return std::make_unique<Client>(rounds, stats); });
        }

        detsim::ChaosConfig chaos;
        chaos.faultCount = sc.faults;
        chaos.start = detsim::millis(50);
        chaos.duration = detsim::seconds(3);
        chaos.allowSkew = false;
        // Clients are targets too: a crashed client starts over from its first write.
        chaos.hosts.push_back(kvHost);
        for (int i = 0; i < sc.clients; ++i)
        {
            chaos.hosts.push_back(sim.host_id("client-" + std::to_string(i)));
        }
        (void)sim.schedule_chaos(chaos);

        out.report = sim.run();
        return out;
    }
}
