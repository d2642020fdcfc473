#pragma once

#include "clock.hpp"
#include "executor.hpp"
#include "network.hpp"
#include "random.hpp"

#include <memory>

namespace detsim
{
    // The pieces of a simulation host code is allowed to reach. Owned by the
    // Simulation; HostContext only borrows them for the duration of one resume.
    struct SimServices
    {
        VirtualClock &clock;
        EntropyManager &entropy;
        SimNetwork &network;
        Executor &executor;
    };

    // Everything a task may do, bound to the task being resumed. There is no
    // ambient "current simulation": every primitive goes through this object.
    class HostContext
    {
    public:
        HostContext(SimServices services, HostId host, TaskId task) noexcept
            : m_services(services), m_host(host), m_task(task)
        {
        }

        HostId host() const noexcept { return m_host; }
        TaskId task() const noexcept { return m_task; }
        const std::string &host_name() const { return m_services.network.host_name(m_host); }

        // This host's view of time (global instant plus any injected skew).
        SimInstant now() const noexcept { return m_services.clock.now_for(m_host); }

        EntropyStream &entropy(std::string_view purpose = "app")
        {
            return m_services.entropy.stream_for(m_host, purpose);
        }

        NetResult<ListenerId> bind(std::uint16_t port) { return m_services.network.bind(m_host, port); }
        void close_listener(ListenerId id) { m_services.network.close_listener(id); }

        // Never suspends: the message is either on the wire, silently lost, or
        // rejected with an error.
        NetError send(ConnectionId conn, std::span<const std::byte> bytes) { return m_services.network.send(conn, bytes); }

        NetError send(ConnectionId conn, std::string_view text)
        {
            return send(conn, std::span<const std::byte>(reinterpret_cast<const std::byte *>(text.data()), text.size()));
        }

        void close(ConnectionId conn) { m_services.network.close(conn); }

        std::optional<Address> peer_address(ConnectionId conn) const { return m_services.network.remote_address(conn); }

        // New task on this host; it joins the back of the ready queue.
        TaskId spawn(std::unique_ptr<ITask> task)
        {
            return m_services.executor.spawn(m_host, std::move(task), false);
        }

        void log(LogLevel lvl, const char *msg) const
        {
            Logger::instance().logf(lvl, m_host, m_services.clock.now(), "%s", msg);
        }

        // Used by the operations below.
        VirtualClock &clock() noexcept { return m_services.clock; }
        SimNetwork &network() noexcept { return m_services.network; }
        Executor &executor() noexcept { return m_services.executor; }

    private:
        SimServices m_services;
        HostId m_host = 0;
        TaskId m_task = 0;
    };

    // --- Suspending operations --------------------------------------------------
    //
    // Each operation is a small state machine owned by the task. poll() returns
    // true once the operation has completed; false means the calling task has
    // been registered for a wake-up and should return TaskPoll::Pending.
    // cancel() withdraws that registration.

    class SleepOp
    {
    public:
        explicit SleepOp(SimDuration duration) noexcept : m_duration(duration) {}

        bool poll(HostContext &ctx)
        {
            if (m_done)
            {
                return true;
            }
            if (!m_timer)
            {
                m_timer = ctx.clock().schedule(m_duration, ctx.task());
                return false;
            }
            if (ctx.clock().is_pending(*m_timer))
            {
                return false;
            }
            m_timer.reset();
            m_done = true;
            return true;
        }

        void cancel(HostContext &ctx)
        {
            if (m_timer)
            {
                ctx.clock().cancel(*m_timer);
                m_timer.reset();
            }
        }

        // Re-arms for another sleep (periodic loops).
        void reset(SimDuration duration) noexcept
        {
            m_duration = duration;
            m_timer.reset();
            m_done = false;
        }

        bool done() const noexcept { return m_done; }

    private:
        SimDuration m_duration = 0;
        std::optional<TimerHandle> m_timer;
        bool m_done = false;
    };

    // Gives every other ready task a turn without letting time pass.
    class YieldOp
    {
    public:
        bool poll(HostContext &ctx)
        {
            if (m_yielded)
            {
                return true;
            }
            m_yielded = true;
            ctx.executor().wake(ctx.task());
            return false;
        }

        void reset() noexcept { m_yielded = false; }

    private:
        bool m_yielded = false;
    };

    class ConnectOp
    {
    public:
        explicit ConnectOp(Address to) : m_to(std::move(to)) {}

        bool poll(HostContext &ctx)
        {
            if (m_done)
            {
                return true;
            }
            if (m_conn == 0)
            {
                const auto r = ctx.network().connect(ctx.host(), m_to);
                if (!r.ok())
                {
                    return finish_(r.error);
                }
                m_conn = r.value;
            }
            const auto st = ctx.network().poll_connect(m_conn, ctx.task());
            if (!st)
            {
                return false;
            }
            return finish_(*st);
        }

        // Abandons a connection that has not been accepted yet.
        void cancel(HostContext &ctx)
        {
            if (m_conn != 0 && !m_done)
            {
                ctx.network().forget_waiter(m_conn, ctx.task());
                ctx.network().close(m_conn);
                m_conn = 0;
            }
        }

        NetError error() const noexcept { return m_error; }
        ConnectionId connection() const noexcept { return m_conn; }

    private:
        bool finish_(NetError e)
        {
            m_error = e;
            m_done = true;
            return true;
        }

        Address m_to;
        ConnectionId m_conn = 0;
        NetError m_error = NetError::None;
        bool m_done = false;
    };

    class AcceptOp
    {
    public:
        explicit AcceptOp(ListenerId listener) noexcept : m_listener(listener) {}

        bool poll(HostContext &ctx)
        {
            if (m_result)
            {
                return true;
            }
            m_result = ctx.network().poll_accept(m_listener, ctx.task());
            return m_result.has_value();
        }

        void cancel(HostContext &ctx) { ctx.network().forget_acceptor(m_listener, ctx.task()); }

        // Ready for the next connection on the same listener.
        void reset() noexcept { m_result.reset(); }

        NetError error() const noexcept { return m_result ? m_result->error : NetError::None; }
        ConnectionId connection() const noexcept { return m_result ? m_result->value : 0; }

    private:
        ListenerId m_listener = 0;
        std::optional<NetResult<ConnectionId>> m_result;
    };

    class RecvOp
    {
    public:
        explicit RecvOp(ConnectionId conn) noexcept : m_conn(conn) {}

        bool poll(HostContext &ctx)
        {
            if (m_result)
            {
                return true;
            }
            m_result = ctx.network().poll_recv(m_conn, ctx.task());
            return m_result.has_value();
        }

        void cancel(HostContext &ctx) { ctx.network().forget_waiter(m_conn, ctx.task()); }

        void reset() noexcept { m_result.reset(); }

        NetError error() const noexcept { return m_result ? m_result->error : NetError::None; }
        const ByteBuffer &data() const { return m_result.value().value; }
        std::string text() const { return string_of(data()); }

    private:
        ConnectionId m_conn = 0;
        std::optional<NetResult<ByteBuffer>> m_result;
    };

    // Races `op` against a sleep. Whichever completes first wins; the loser's
    // registration is withdrawn before poll() returns.
    template <class Op>
    class Timeout
    {
    public:
        Timeout(Op op, SimDuration limit) : m_op(std::move(op)), m_sleep(limit) {}

        bool poll(HostContext &ctx)
        {
            if (m_done)
            {
                return true;
            }
            if (m_op.poll(ctx))
            {
                m_sleep.cancel(ctx);
                m_done = true;
                return true;
            }
            if (m_sleep.poll(ctx))
            {
                m_op.cancel(ctx);
                m_timedOut = true;
                m_done = true;
                return true;
            }
            return false;
        }

        bool timed_out() const noexcept { return m_timedOut; }
        Op &inner() noexcept { return m_op; }
        const Op &inner() const noexcept { return m_op; }

    private:
        Op m_op;
        SleepOp m_sleep;
        bool m_timedOut = false;
        bool m_done = false;
    };
}
