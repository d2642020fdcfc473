#pragma once

// Small host programs shared by the scenario tests.

#include "context.hpp"
#include "task.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace detsim_test
{
    constexpr std::uint16_t EchoPort = 9000;

    // Echoes every chunk back, optionally after a delay. Closes once the peer does.
    class EchoSession final : public detsim::ITask
    {
    public:
        EchoSession(detsim::ConnectionId conn, detsim::SimDuration replyDelay)
            : m_conn(conn), m_recv(conn), m_delay(replyDelay)
        {
        }

        detsim::TaskPoll resume(detsim::HostContext &ctx) override
        {
            while (true)
            {
                if (!m_pending)
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
                    m_pending = m_recv.data();
                    m_recv.reset();
                    m_sleep.reset(m_delay);
                }

                if (m_delay > 0 && !m_sleep.poll(ctx))
                {
                    return detsim::TaskPoll::Pending;
                }
                // A failed echo is the client's problem; it observes it as a timeout or close.
                (void)ctx.send(m_conn, *m_pending);
                m_pending.reset();
            }
        }

        std::string name() const override { return "echo-session"; }

    private:
        detsim::ConnectionId m_conn = 0;
        detsim::RecvOp m_recv;
        detsim::SleepOp m_sleep{0};
        detsim::SimDuration m_delay = 0;
        std::optional<detsim::ByteBuffer> m_pending;
    };

    class EchoServer final : public detsim::ITask
    {
    public:
        explicit EchoServer(detsim::SimDuration replyDelay = 0, int *starts = nullptr)
            : m_delay(replyDelay), m_starts(starts)
        {
        }

        void on_start(detsim::HostContext &ctx) override
        {
            const auto r = ctx.bind(EchoPort);
            if (!r.ok())
            {
                throw std::runtime_error(std::string("echo server bind: ") + detsim::net_error_name(r.error));
            }
            m_accept.emplace(r.value);
            if (m_starts)
            {
                ++*m_starts;
            }
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
                ctx.spawn(std::make_unique<EchoSession>(m_accept->connection(), m_delay));
                m_accept->reset();
            }
        }

        std::string name() const override { return "echo-server"; }

    private:
        detsim::SimDuration m_delay = 0;
        int *m_starts = nullptr;
        std::optional<detsim::AcceptOp> m_accept;
    };

    inline detsim::HostEntry echo_server(detsim::SimDuration replyDelay = 0, int *starts = nullptr)
    {
        return [replyDelay, starts]()
        {
            return std::make_unique<EchoServer>(replyDelay, starts);
        };
    }

    // Sends `rounds` numbered messages, waiting up to `patience` for each echo
    // and a random pause from the host's own stream in between. Gives up on the
    // first connection error; loss and partitions show up as timeouts.
    class ChatterClient final : public detsim::ITask
    {
    public:
        ChatterClient(int rounds, detsim::SimDuration patience)
            : m_connect(detsim::Address{"server", EchoPort}), m_rounds(rounds), m_patience(patience)
        {
        }

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
                    return detsim::TaskPoll::Done;
                }
                m_conn = m_connect.connection();
            }

            while (m_round < m_rounds)
            {
                if (!m_wait)
                {
                    const std::string msg = ctx.host_name() + "#" + std::to_string(m_round);
                    if (ctx.send(m_conn, msg) == detsim::NetError::ConnectionClosed)
                    {
                        return detsim::TaskPoll::Done;
                    }
                    m_wait.emplace(detsim::RecvOp(m_conn), m_patience);
                }
                if (!m_wait->poll(ctx))
                {
                    return detsim::TaskPoll::Pending;
                }
                if (!m_wait->timed_out() && m_wait->inner().error() != detsim::NetError::None)
                {
                    return detsim::TaskPoll::Done;
                }
                if (!m_pausing)
                {
                    m_pausing = true;
                    m_pause.reset(static_cast<detsim::SimDuration>(ctx.entropy("pause").next_range(0, detsim::millis(20))));
                }
                if (!m_pause.poll(ctx))
                {
                    return detsim::TaskPoll::Pending;
                }
                m_pausing = false;
                m_wait.reset();
                ++m_round;
            }
            ctx.close(m_conn);
            return detsim::TaskPoll::Done;
        }

        std::string name() const override { return "chatter"; }

    private:
        detsim::ConnectOp m_connect;
        detsim::ConnectionId m_conn = 0;
        int m_rounds = 0;
        int m_round = 0;
        detsim::SimDuration m_patience = 0;
        std::optional<detsim::Timeout<detsim::RecvOp>> m_wait;
        detsim::SleepOp m_pause{0};
        bool m_pausing = false;
    };

    inline detsim::HostEntry chatter(int rounds, detsim::SimDuration patience)
    {
        return [rounds, patience]()
        {
            return std::make_unique<ChatterClient>(rounds, patience);
        };
    }
}
