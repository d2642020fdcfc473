/*
Purpose: End-to-end smoke test of the simulated network.

What this tests: A client connects to an echo server over a link with a fixed 10ms
latency, sends "ping" and reads the echo. The request lands at t=10ms, the reply at
t=20ms, and the run completes as soon as the client task finishes even though the
server keeps listening.
*/

#include "echo_hosts.hpp"
#include "simulation.hpp"

#include <cassert>
#include <memory>
#include <optional>
#include <string>

namespace
{
    class PingClient final : public detsim::ITask
    {
    public:
        PingClient(std::string *reply, detsim::SimInstant *repliedAt)
            : m_connect(detsim::Address::parse("server:9000")), m_reply(reply), m_repliedAt(repliedAt)
        {
        }

        detsim::TaskPoll resume(detsim::HostContext &ctx) override
        {
            if (!m_recv)
            {
                if (!m_connect.poll(ctx))
                {
                    return detsim::TaskPoll::Pending;
                }
                assert(m_connect.error() == detsim::NetError::None);
                m_conn = m_connect.connection();
                assert(ctx.send(m_conn, "ping") == detsim::NetError::None);
                m_recv.emplace(m_conn);
            }

            if (!m_recv->poll(ctx))
            {
                return detsim::TaskPoll::Pending;
            }
            assert(m_recv->error() == detsim::NetError::None);
            *m_reply = m_recv->text();
            *m_repliedAt = ctx.now();
            ctx.close(m_conn);
            return detsim::TaskPoll::Done;
        }

        std::string name() const override { return "ping-client"; }

    private:
        detsim::ConnectOp m_connect;
        detsim::ConnectionId m_conn = 0;
        std::optional<detsim::RecvOp> m_recv;
        std::string *m_reply = nullptr;
        detsim::SimInstant *m_repliedAt = nullptr;
    };
}

int main()
{
    detsim::SimulationConfig cfg;
    cfg.seed = 7;
    cfg.defaultLink = detsim::LinkConfig{detsim::millis(10), detsim::millis(10), 0.0};
    cfg.recordTrail = true;
    cfg.enableInvariantChecks = true;

    detsim::Simulation sim(cfg);

    std::string reply;
    detsim::SimInstant repliedAt = 0;

    const detsim::HostId server = sim.add_host("server", detsim_test::echo_server());
    const detsim::HostId client = sim.add_client("client", [&]()
                                                 { return std::make_unique<PingClient>(&reply, &repliedAt); });
    assert(server != client);
    assert(server != detsim::RuntimeHost && client != detsim::RuntimeHost);
    assert(sim.host_id("server") == server);
    assert(sim.host_name(client) == "client");

    const detsim::RunReport report = sim.run();
    assert(report.ok());
    assert(report.outcome == detsim::RunOutcome::Completed);
    assert(reply == "ping");
    assert(repliedAt == detsim::millis(20));
    assert(report.finalInstant == detsim::millis(20));
    assert(report.network.sent == 2);
    assert(report.network.delivered == 2);
    assert(report.network.bytesDelivered == 8);
    assert(!report.failureInstant);

    // The trail shows the request arriving at the server and the reply at the client.
    std::size_t deliveries = 0;
    for (const auto &r : report.trail)
    {
        if (r.kind != detsim::TraceKind::Deliver)
        {
            continue;
        }
        ++deliveries;
        if (r.host == client)
        {
            assert(r.peer == server);
            assert(r.at == detsim::millis(10));
            assert(r.b == detsim::fnv1a64(std::string_view("ping")));
        }
        else
        {
            assert(r.host == server);
            assert(r.at == detsim::millis(20));
        }
    }
    assert(deliveries == 2);
    assert(report.traceCount == report.trail.size());

    // A finished run stays finished.
    assert(!sim.step());
    assert(sim.finished());

    // Host names are addresses: they must be unique and must not contain ':'.
    {
        detsim::Simulation other(detsim::SimulationConfig{});
        (void)other.add_host("a", detsim_test::echo_server());

        bool threw = false;
        try
        {
            (void)other.add_host("a", detsim_test::echo_server());
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        try
        {
            (void)other.add_host("b:1", detsim_test::echo_server());
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    return 0;
}
