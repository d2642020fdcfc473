#include "context.hpp"
#include "simulation.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string_view>

// A ping client and an echo server, driven step by step so the test harness
// can cut the link in the middle of the conversation and heal it later.

namespace
{
    constexpr std::uint16_t EchoPort = 1738;

    class EchoServer final : public detsim::ITask
    {
    public:
        void on_start(detsim::HostContext &ctx) override
        {
            const auto r = ctx.bind(EchoPort);
            if (!r.ok())
            {
                throw std::runtime_error(std::string("bind: ") + detsim::net_error_name(r.error));
            }
            m_accept.emplace(r.value);
        }

        detsim::TaskPoll resume(detsim::HostContext &ctx) override
        {
            while (true)
            {
                if (!m_conn)
                {
                    if (!m_accept->poll(ctx))
                    {
                        return detsim::TaskPoll::Pending;
                    }
                    if (m_accept->error() != detsim::NetError::None)
                    {
                        return detsim::TaskPoll::Done;
                    }
                    m_conn = m_accept->connection();
                    m_accept->reset();
                    m_recv.emplace(*m_conn);
                }

                if (!m_recv->poll(ctx))
                {
                    return detsim::TaskPoll::Pending;
                }
                if (m_recv->error() != detsim::NetError::None)
                {
                    ctx.close(*m_conn);
                    m_conn.reset();
                    continue;
                }
                ctx.log(detsim::LogLevel::Info, ("echo " + m_recv->text()).c_str());
                (void)ctx.send(*m_conn, m_recv->data());
                m_recv->reset();
            }
        }

        std::string name() const override { return "echo-server"; }

    private:
        std::optional<detsim::AcceptOp> m_accept;
        std::optional<detsim::ConnectionId> m_conn;
        std::optional<detsim::RecvOp> m_recv;
    };

    // Pings, waits up to 50ms for the answer, pauses 50ms, repeats.
    class PingClient final : public detsim::ITask
    {
    public:
        explicit PingClient(int pings) : m_pings(pings), m_connect(detsim::Address{"server", EchoPort}) {}

        detsim::TaskPoll resume(detsim::HostContext &ctx) override
        {
            if (m_conn == 0)
            {
                if (!m_connect.poll(ctx))
                {
                    return detsim::TaskPoll::Pending;
                }
                if (m_connect.error() != detsim::NetError::None)
                {
                    throw std::runtime_error(std::string("connect: ") + detsim::net_error_name(m_connect.error()));
                }
                m_conn = m_connect.connection();
            }

            while (m_sent < m_pings)
            {
                if (!m_wait)
                {
                    const detsim::NetError err = ctx.send(m_conn, "ping " + std::to_string(m_sent));
                    std::cout << "t=" << ctx.now() / 1000000 << "ms send ping " << m_sent << ": "
                              << detsim::net_error_name(err) << "\n";
                    m_wait.emplace(detsim::RecvOp(m_conn), detsim::millis(50));
                }
                if (!m_wait->poll(ctx))
                {
                    return detsim::TaskPoll::Pending;
                }
                if (m_wait->timed_out())
                {
                    std::cout << "t=" << ctx.now() / 1000000 << "ms no answer\n";
                }
                else if (m_wait->inner().error() == detsim::NetError::None)
                {
                    std::cout << "t=" << ctx.now() / 1000000 << "ms got '" << m_wait->inner().text() << "'\n";
                }
                else
                {
                    throw std::runtime_error("echo server hung up");
                }

                if (!m_pausing)
                {
                    m_pausing = true;
                    m_pause.reset(detsim::millis(50));
                }
                if (!m_pause.poll(ctx))
                {
                    return detsim::TaskPoll::Pending;
                }
                m_pausing = false;
                m_wait.reset();
                ++m_sent;
            }
            ctx.close(m_conn);
            return detsim::TaskPoll::Done;
        }

        std::string name() const override { return "ping-client"; }

    private:
        int m_pings = 0;
        int m_sent = 0;
        detsim::ConnectOp m_connect;
        detsim::ConnectionId m_conn = 0;
        std::optional<detsim::Timeout<detsim::RecvOp>> m_wait;
        detsim::SleepOp m_pause{0};
        bool m_pausing = false;
    };

    struct Params
    {
        std::uint64_t seed = 1;
        bool verbose = false;
    };

    [[noreturn]] void usage_and_exit()
    {
        std::cerr << "Echo demo (manual partition and repair)\n"
                  << "  --seed S   (default: DETSIM_SEED or 1)\n"
                  << "  --verbose       log at INFO (otherwise DETSIM_LOG, default OFF)\n";
        std::exit(2);
    }

    Params parse_args(int argc, char **argv)
    {
        Params p;
        p.seed = detsim::seed_from_env("DETSIM_SEED", 1);
        for (int i = 1; i < argc; ++i)
        {
            std::string_view a(argv[i]);
            if (a == "--seed")
            {
                if (i + 1 >= argc)
                {
                    usage_and_exit();
                }
                const std::string_view v(argv[++i]);
                auto r = std::from_chars(v.data(), v.data() + v.size(), p.seed);
                if (r.ec != std::errc() || r.ptr != v.data() + v.size())
                {
                    usage_and_exit();
                }
            }
            else if (a == "--verbose")
            {
                p.verbose = true;
            }
            else
            {
                usage_and_exit();
            }
        }
        return p;
    }
}

int main(int argc, char **argv)
{
    const Params p = parse_args(argc, argv);

    detsim::SimulationConfig cfg;
    cfg.seed = p.seed;
    cfg.defaultLink = detsim::LinkConfig{detsim::millis(5), detsim::millis(15), 0.0};
    cfg.maxDuration = detsim::seconds(10);
    cfg.logLevel = p.verbose ? detsim::LogLevel::Info : detsim::log_level_from_env("DETSIM_LOG", detsim::LogLevel::Off);

    detsim::Simulation sim(cfg);
    (void)sim.add_host("server", []()
                       { return std::make_unique<EchoServer>(); });
    (void)sim.add_client("client", []()
                         { return std::make_unique<PingClient>(10); });

    // Let a few pings through, cut the link for a while, then heal it.
    while (sim.now() < detsim::millis(250) && sim.step())
    {
    }
    std::cout << "-- partition at t=" << sim.now() / 1000000 << "ms\n";
    sim.partition("client", "server");

    while (sim.now() < detsim::millis(600) && sim.step())
    {
    }
    std::cout << "-- repair at t=" << sim.now() / 1000000 << "ms\n";
    sim.repair("client", "server");

    const detsim::RunReport report = sim.run();
    std::cout << "outcome=" << detsim::run_outcome_name(report.outcome)
              << " t=" << report.finalInstant / 1000000 << "ms"
              << " delivered=" << report.network.delivered
              << " rejected=" << report.network.rejectedSends
              << " digest=" << report.traceDigest << "\n";

    if (!report.ok())
    {
        std::cerr << report.describe();
        return 1;
    }
    return 0;
}
