#pragma once

#include "clock.hpp"
#include "log.hpp"
#include "random.hpp"
#include "trace.hpp"

#include <charconv>
#include <deque>
#include <functional>
#include <set>
#include <stdexcept>
#include <utility>

namespace detsim
{
    // Errors handed back to the calling task as values. They describe conditions
    // a real network produces; none of them is a bug in the caller.
    enum class NetError : std::uint8_t
    {
        None = 0,
        AddressInUse = 1,
        ConnectionRefused = 2,
        ConnectionClosed = 3,
        NetworkUnreachable = 4,
    };

    inline const char *net_error_name(NetError e) noexcept
    {
        switch (e)
        {
        case NetError::None:
            return "ok";
        case NetError::AddressInUse:
            return "address in use";
        case NetError::ConnectionRefused:
            return "connection refused";
        case NetError::ConnectionClosed:
            return "connection closed";
        case NetError::NetworkUnreachable:
            return "network unreachable";
        }
        return "unknown";
    }

    template <class T>
    struct NetResult
    {
        NetError error = NetError::None;
        T value{};

        bool ok() const noexcept { return error == NetError::None; }
    };

    // "host-name:port"
    struct Address
    {
        std::string host;
        std::uint16_t port = 0;

        static Address parse(std::string_view text)
        {
            const auto colon = text.rfind(':');
            if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size())
            {
                throw std::invalid_argument("Address::parse: expected host:port, got '" + std::string(text) + "'");
            }
            const std::string_view portText = text.substr(colon + 1);
            unsigned value = 0;
            const auto res = std::from_chars(portText.data(), portText.data() + portText.size(), value);
            if (res.ec != std::errc() || res.ptr != portText.data() + portText.size() || value > 0xFFFFu)
            {
                throw std::invalid_argument("Address::parse: bad port in '" + std::string(text) + "'");
            }
            return Address{std::string(text.substr(0, colon)), static_cast<std::uint16_t>(value)};
        }

        std::string to_string() const { return host + ":" + std::to_string(port); }

        friend bool operator==(const Address &lhs, const Address &rhs)
        {
            return lhs.port == rhs.port && lhs.host == rhs.host;
        }
    };

    struct LinkConfig
    {
        SimDuration minLatency = millis(1);
        SimDuration maxLatency = millis(1);
        double lossRate = 0.0;
    };

    enum class ConnState : std::uint8_t
    {
        Connecting = 0,
        Established = 1,
        Closed = 2,
    };

    struct NetworkStats
    {
        std::uint64_t sent = 0;
        std::uint64_t delivered = 0;
        std::uint64_t droppedLoss = 0;
        std::uint64_t droppedPartition = 0;
        std::uint64_t droppedClosed = 0;
        std::uint64_t rejectedSends = 0;
        std::uint64_t bytesDelivered = 0;
    };

    // In-memory stream transport between simulated hosts.
    //
    // Every operation is keyed by integer handles. Blocking operations come in a
    // poll_* form: they either complete, or register the calling task as a
    // waiter and return nullopt; the waiter is woken through the wake callback
    // when the awaited state changes.
    class SimNetwork
    {
    public:
        using WakeFn = std::function<void(TaskId)>;

        SimNetwork(const VirtualClock &clock, EntropyManager &entropy, EventTrail &trail, LinkConfig defaults)
            : m_clock(clock), m_entropy(entropy), m_trail(trail), m_defaultLink(defaults)
        {
            validate_link_(defaults);
        }

        void set_waker(WakeFn fn) { m_wake = std::move(fn); }

        // --- Host naming -----------------------------------------------------------

        void register_host(HostId host, const std::string &name)
        {
            if (host == RuntimeHost)
            {
                throw std::runtime_error("register_host: HostId 0 is reserved");
            }
            auto [it, inserted] = m_hostByName.emplace(name, host);
            if (!inserted)
            {
                throw std::runtime_error("register_host: duplicate host name '" + name + "'");
            }
            m_nameByHost[host] = name;
        }

        std::optional<HostId> resolve(std::string_view name) const
        {
            auto it = m_hostByName.find(std::string(name));
            if (it == m_hostByName.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        const std::string &host_name(HostId host) const
        {
            auto it = m_nameByHost.find(host);
            if (it == m_nameByHost.end())
            {
                throw std::runtime_error("SimNetwork: unknown HostId=" + std::to_string(host));
            }
            return it->second;
        }

        // --- Partitions and link configuration ------------------------------------

        void partition(HostId a, HostId b)
        {
            if (a == b)
            {
                return;
            }
            m_partitions.insert(link_key_(a, b));
        }

        void repair(HostId a, HostId b) { m_partitions.erase(link_key_(a, b)); }

        bool partitioned(HostId a, HostId b) const
        {
            return a != b && m_partitions.count(link_key_(a, b)) != 0;
        }

        void set_default_link(LinkConfig cfg)
        {
            validate_link_(cfg);
            m_defaultLink = cfg;
        }

        void set_link_latency(HostId a, HostId b, SimDuration minLatency, SimDuration maxLatency)
        {
            LinkConfig cfg = link(a, b);
            cfg.minLatency = minLatency;
            cfg.maxLatency = maxLatency;
            validate_link_(cfg);
            m_links[link_key_(a, b)] = cfg;
        }

        void set_link_loss(HostId a, HostId b, double lossRate)
        {
            LinkConfig cfg = link(a, b);
            cfg.lossRate = lossRate;
            validate_link_(cfg);
            m_links[link_key_(a, b)] = cfg;
        }

        LinkConfig link(HostId a, HostId b) const
        {
            auto it = m_links.find(link_key_(a, b));
            return (it == m_links.end()) ? m_defaultLink : it->second;
        }

        // --- Listeners -------------------------------------------------------------

        NetResult<ListenerId> bind(HostId host, std::uint16_t port)
        {
            const auto key = std::make_pair(host, port);
            if (m_listenerByAddr.count(key) != 0)
            {
                return {NetError::AddressInUse, 0};
            }
            const ListenerId id = m_nextListener++;
            Listener l;
            l.host = host;
            l.port = port;
            m_listeners.emplace(id, std::move(l));
            m_listenerByAddr.emplace(key, id);
            return {NetError::None, id};
        }

        void close_listener(ListenerId id)
        {
            auto it = m_listeners.find(id);
            if (it == m_listeners.end())
            {
                return;
            }
            Listener l = std::move(it->second);
            m_listenerByAddr.erase(std::make_pair(l.host, l.port));
            m_listeners.erase(it);

            for (ConnectionId pending : l.backlog)
            {
                refuse_pending_(pending);
            }
            wake_all_(l.acceptors);
        }

        std::optional<NetResult<ConnectionId>> poll_accept(ListenerId id, TaskId waiter)
        {
            auto it = m_listeners.find(id);
            if (it == m_listeners.end())
            {
                return NetResult<ConnectionId>{NetError::ConnectionClosed, 0};
            }
            Listener &l = it->second;
            while (!l.backlog.empty())
            {
                const ConnectionId serverSide = l.backlog.front();
                l.backlog.pop_front();

                auto sit = m_endpoints.find(serverSide);
                if (sit == m_endpoints.end() || sit->second.state != ConnState::Connecting)
                {
                    // The connecting side gave up or went away before we got here.
                    continue;
                }
                Endpoint &server = sit->second;
                server.state = ConnState::Established;

                auto cit = m_endpoints.find(server.peer);
                if (cit != m_endpoints.end())
                {
                    cit->second.state = ConnState::Established;
                    wake_all_(cit->second.waiters);
                }

                m_trail.record(TraceRecord{m_clock.now(), TraceKind::Accept, server.localHost, server.remoteHost, serverSide, server.peer});
                return NetResult<ConnectionId>{NetError::None, serverSide};
            }

            add_waiter_(l.acceptors, waiter);
            return std::nullopt;
        }

        // --- Connections -----------------------------------------------------------

        // Starts a connection. On success the returned endpoint is Connecting; it
        // becomes Established once the listener accepts it (see poll_connect).
        NetResult<ConnectionId> connect(HostId host, const Address &to)
        {
            const auto dst = resolve(to.host);
            if (!dst)
            {
                return {NetError::ConnectionRefused, 0};
            }
            if (partitioned(host, *dst))
            {
                return {NetError::NetworkUnreachable, 0};
            }
            auto lit = m_listenerByAddr.find(std::make_pair(*dst, to.port));
            if (lit == m_listenerByAddr.end())
            {
                return {NetError::ConnectionRefused, 0};
            }

            const ConnectionId clientId = m_nextConnection++;
            const ConnectionId serverId = m_nextConnection++;

            Endpoint client;
            client.peer = serverId;
            client.localHost = host;
            client.remoteHost = *dst;
            client.local = Address{host_name(host), next_ephemeral_port_(host)};
            client.remote = to;

            Endpoint server;
            server.peer = clientId;
            server.localHost = *dst;
            server.remoteHost = host;
            server.local = to;
            server.remote = client.local;
            server.listener = lit->second;

            m_endpoints.emplace(clientId, std::move(client));
            m_endpoints.emplace(serverId, std::move(server));

            Listener &l = m_listeners.at(lit->second);
            l.backlog.push_back(serverId);
            wake_all_(l.acceptors);

            m_trail.record(TraceRecord{m_clock.now(), TraceKind::Connect, host, *dst, clientId, to.port});
            return {NetError::None, clientId};
        }

        // NetError::None once established; nullopt while still waiting for accept.
        std::optional<NetError> poll_connect(ConnectionId id, TaskId waiter)
        {
            auto it = m_endpoints.find(id);
            if (it == m_endpoints.end())
            {
                return NetError::ConnectionRefused;
            }
            Endpoint &ep = it->second;
            switch (ep.state)
            {
            case ConnState::Established:
                return NetError::None;
            case ConnState::Closed:
                return NetError::ConnectionRefused;
            case ConnState::Connecting:
                break;
            }
            add_waiter_(ep.waiters, waiter);
            return std::nullopt;
        }

        NetError send(ConnectionId id, std::span<const std::byte> bytes)
        {
            auto it = m_endpoints.find(id);
            if (it == m_endpoints.end())
            {
                return NetError::ConnectionClosed;
            }
            Endpoint &ep = it->second;
            if (ep.state != ConnState::Established || ep.reset)
            {
                return NetError::ConnectionClosed;
            }
            if (partitioned(ep.localHost, ep.remoteHost))
            {
                ++m_stats.rejectedSends;
                m_trail.record(TraceRecord{m_clock.now(), TraceKind::SendRejected, ep.localHost, ep.remoteHost, id, bytes.size()});
                return NetError::NetworkUnreachable;
            }

            const LinkConfig cfg = link(ep.localHost, ep.remoteHost);

            // Both draws happen on every send so that stream positions do not
            // depend on the outcome of either one.
            const auto latency = m_entropy.stream_for(ep.localHost, "net.latency").next_range(static_cast<std::uint64_t>(cfg.minLatency), static_cast<std::uint64_t>(cfg.maxLatency));
            const bool lost = m_entropy.stream_for(ep.localHost, "net.loss").next_bool(cfg.lossRate);

            const std::uint64_t payloadHash = fnv1a64(bytes);
            ++m_stats.sent;
            m_trail.record(TraceRecord{m_clock.now(), TraceKind::Send, ep.localHost, ep.remoteHost, id, payloadHash});

            if (lost)
            {
                ++m_stats.droppedLoss;
                m_trail.record(TraceRecord{m_clock.now(), TraceKind::DropLoss, ep.localHost, ep.remoteHost, id, payloadHash});
                Logger::instance().logf(LogLevel::Trace, ep.localHost, m_clock.now(), "send lost: conn=%llu bytes=%zu",
                                        static_cast<unsigned long long>(id), bytes.size());
                return NetError::None;
            }

            enqueue_(ep, ByteBuffer(bytes.begin(), bytes.end()), static_cast<SimDuration>(latency), false);
            return NetError::None;
        }

        // Returns every buffered byte, or ConnectionClosed once the stream is
        // finished and drained; nullopt while waiting for data.
        std::optional<NetResult<ByteBuffer>> poll_recv(ConnectionId id, TaskId waiter)
        {
            auto it = m_endpoints.find(id);
            if (it == m_endpoints.end())
            {
                return NetResult<ByteBuffer>{NetError::ConnectionClosed, {}};
            }
            Endpoint &ep = it->second;
            if (ep.state == ConnState::Closed)
            {
                return NetResult<ByteBuffer>{NetError::ConnectionClosed, {}};
            }
            if (!ep.buffer.empty())
            {
                ByteBuffer out(ep.buffer.begin(), ep.buffer.end());
                ep.buffer.clear();
                return NetResult<ByteBuffer>{NetError::None, std::move(out)};
            }
            if (ep.eof || ep.reset)
            {
                return NetResult<ByteBuffer>{NetError::ConnectionClosed, {}};
            }
            add_waiter_(ep.waiters, waiter);
            return std::nullopt;
        }

        // Graceful close: the peer sees end-of-stream after the data sent before it.
        void close(ConnectionId id)
        {
            auto it = m_endpoints.find(id);
            if (it == m_endpoints.end())
            {
                return;
            }
            Endpoint &ep = it->second;
            if (ep.state == ConnState::Closed)
            {
                return;
            }

            const ConnState prev = ep.state;
            ep.state = ConnState::Closed;
            m_trail.record(TraceRecord{m_clock.now(), TraceKind::Close, ep.localHost, ep.remoteHost, id, 0});

            if (prev == ConnState::Connecting)
            {
                // Withdraw a half-open connection: the other side sees a refusal.
                auto pit = m_endpoints.find(ep.peer);
                if (pit != m_endpoints.end() && pit->second.state == ConnState::Connecting)
                {
                    pit->second.state = ConnState::Closed;
                    wake_all_(pit->second.waiters);
                }
            }
            else if (!ep.reset && !partitioned(ep.localHost, ep.remoteHost))
            {
                enqueue_(ep, {}, link(ep.localHost, ep.remoteHost).minLatency, true);
            }

            wake_all_(ep.waiters);
            release_if_finished_(id);
        }

        ConnState state_of(ConnectionId id) const
        {
            auto it = m_endpoints.find(id);
            return (it == m_endpoints.end()) ? ConnState::Closed : it->second.state;
        }

        std::optional<Address> local_address(ConnectionId id) const
        {
            auto it = m_endpoints.find(id);
            if (it == m_endpoints.end())
            {
                return std::nullopt;
            }
            return it->second.local;
        }

        std::optional<Address> remote_address(ConnectionId id) const
        {
            auto it = m_endpoints.find(id);
            if (it == m_endpoints.end())
            {
                return std::nullopt;
            }
            return it->second.remote;
        }

        // Removes a task from every wait list (used when it is cancelled or finishes).
        void forget_waiter(TaskId task)
        {
            for (auto &[id, ep] : m_endpoints)
            {
                (void)id;
                remove_waiter_(ep.waiters, task);
            }
            for (auto &[id, l] : m_listeners)
            {
                (void)id;
                remove_waiter_(l.acceptors, task);
            }
        }

        void forget_waiter(ConnectionId id, TaskId task)
        {
            auto it = m_endpoints.find(id);
            if (it != m_endpoints.end())
            {
                remove_waiter_(it->second.waiters, task);
            }
        }

        void forget_acceptor(ListenerId id, TaskId task)
        {
            auto it = m_listeners.find(id);
            if (it != m_listeners.end())
            {
                remove_waiter_(it->second.acceptors, task);
            }
        }

        // Abrupt teardown of everything a host owns. Peers are reset: they can
        // drain what already arrived and then see ConnectionClosed.
        void crash_host(HostId host)
        {
            std::vector<ListenerId> listeners;
            for (const auto &[id, l] : m_listeners)
            {
                if (l.host == host)
                {
                    listeners.push_back(id);
                }
            }
            for (ListenerId id : listeners)
            {
                close_listener(id);
            }

            std::vector<ConnectionId> owned;
            for (const auto &[id, ep] : m_endpoints)
            {
                if (ep.localHost == host)
                {
                    owned.push_back(id);
                }
            }
            for (ConnectionId id : owned)
            {
                auto it = m_endpoints.find(id);
                if (it == m_endpoints.end())
                {
                    continue;
                }
                const ConnectionId peerId = it->second.peer;
                m_endpoints.erase(it);

                auto pit = m_endpoints.find(peerId);
                if (pit == m_endpoints.end())
                {
                    continue;
                }
                Endpoint &peer = pit->second;
                if (peer.state == ConnState::Connecting)
                {
                    peer.state = ConnState::Closed;
                }
                peer.reset = true;
                wake_all_(peer.waiters);
            }
            m_ephemeral.erase(host);
        }

        // --- Delivery --------------------------------------------------------------

        std::optional<SimInstant> next_delivery() const
        {
            if (m_inflight.empty())
            {
                return std::nullopt;
            }
            return m_inflight.begin()->first.first;
        }

        std::size_t inflight() const noexcept { return m_inflight.size(); }

        // Delivers every message due at or before `now`, in (delivery instant, send order).
        std::size_t deliver_due(SimInstant now)
        {
            std::size_t delivered = 0;
            while (!m_inflight.empty() && m_inflight.begin()->first.first <= now)
            {
                auto node = m_inflight.extract(m_inflight.begin());
                InFlightMessage &msg = node.mapped();
                const std::uint64_t payloadHash = fnv1a64(msg.payload);

                // Partitions apply to traffic already on the wire.
                if (partitioned(msg.srcHost, msg.dstHost))
                {
                    ++m_stats.droppedPartition;
                    m_trail.record(TraceRecord{now, TraceKind::DropPartition, msg.srcHost, msg.dstHost, msg.dst, payloadHash});
                    continue;
                }

                auto it = m_endpoints.find(msg.dst);
                if (it == m_endpoints.end() || it->second.state == ConnState::Closed || it->second.reset)
                {
                    ++m_stats.droppedClosed;
                    m_trail.record(TraceRecord{now, TraceKind::DropClosed, msg.srcHost, msg.dstHost, msg.dst, payloadHash});
                    continue;
                }

                Endpoint &ep = it->second;
                if (msg.fin)
                {
                    ep.eof = true;
                }
                else
                {
                    ep.buffer.insert(ep.buffer.end(), msg.payload.begin(), msg.payload.end());
                    ++m_stats.delivered;
                    m_stats.bytesDelivered += msg.payload.size();
                }
                m_trail.record(TraceRecord{now, TraceKind::Deliver, msg.srcHost, msg.dstHost, msg.dst, payloadHash});
                Logger::instance().logf(LogLevel::Trace, msg.dstHost, now, "deliver: conn=%llu bytes=%zu fin=%d",
                                        static_cast<unsigned long long>(msg.dst), msg.payload.size(), msg.fin ? 1 : 0);
                wake_all_(ep.waiters);
                ++delivered;
            }
            return delivered;
        }

        const NetworkStats &stats() const noexcept { return m_stats; }

    private:
        struct Endpoint
        {
            ConnectionId peer = 0;
            HostId localHost = 0;
            HostId remoteHost = 0;
            Address local;
            Address remote;
            ListenerId listener = 0;
            ConnState state = ConnState::Connecting;

            std::deque<std::byte> buffer;
            bool eof = false;
            bool reset = false;

            // Latest delivery instant scheduled from this endpoint; keeps the
            // byte stream in order whatever latency each send draws.
            SimInstant lastDelivery = 0;

            std::vector<TaskId> waiters;
        };

        struct Listener
        {
            HostId host = 0;
            std::uint16_t port = 0;
            std::deque<ConnectionId> backlog;
            std::vector<TaskId> acceptors;
        };

        struct InFlightMessage
        {
            HostId srcHost = 0;
            HostId dstHost = 0;
            ConnectionId dst = 0;
            ByteBuffer payload;
            bool fin = false;
        };

        static std::pair<HostId, HostId> link_key_(HostId a, HostId b) noexcept
        {
            return (a < b) ? std::make_pair(a, b) : std::make_pair(b, a);
        }

        static void validate_link_(const LinkConfig &cfg)
        {
            if (cfg.minLatency < 0 || cfg.maxLatency < cfg.minLatency)
            {
                throw std::invalid_argument("LinkConfig: latency range must satisfy 0 <= min <= max");
            }
            if (!(cfg.lossRate >= 0.0 && cfg.lossRate <= 1.0))
            {
                throw std::invalid_argument("LinkConfig: loss rate must be within [0, 1]");
            }
        }

        std::uint16_t next_ephemeral_port_(HostId host)
        {
            auto [it, inserted] = m_ephemeral.emplace(host, static_cast<std::uint16_t>(49152));
            const std::uint16_t port = it->second;
            it->second = (port == 0xFFFFu) ? static_cast<std::uint16_t>(49152) : static_cast<std::uint16_t>(port + 1);
            return port;
        }

        void enqueue_(Endpoint &from, ByteBuffer payload, SimDuration latency, bool fin)
        {
            const SimInstant due = std::max(instant_after(m_clock.now(), latency), from.lastDelivery);
            from.lastDelivery = due;

            InFlightMessage msg;
            msg.srcHost = from.localHost;
            msg.dstHost = from.remoteHost;
            msg.dst = from.peer;
            msg.payload = std::move(payload);
            msg.fin = fin;
            m_inflight.emplace(std::make_pair(due, m_nextSendSeq++), std::move(msg));
        }

        void refuse_pending_(ConnectionId serverSide)
        {
            auto sit = m_endpoints.find(serverSide);
            if (sit == m_endpoints.end())
            {
                return;
            }
            const ConnectionId clientSide = sit->second.peer;
            m_endpoints.erase(sit);

            auto cit = m_endpoints.find(clientSide);
            if (cit != m_endpoints.end() && cit->second.state == ConnState::Connecting)
            {
                cit->second.state = ConnState::Closed;
                wake_all_(cit->second.waiters);
            }
        }

        // Both ends closed: nothing can observe the pair any more.
        void release_if_finished_(ConnectionId id)
        {
            auto it = m_endpoints.find(id);
            if (it == m_endpoints.end() || it->second.state != ConnState::Closed)
            {
                return;
            }
            auto pit = m_endpoints.find(it->second.peer);
            if (pit != m_endpoints.end() && pit->second.state != ConnState::Closed)
            {
                return;
            }
            if (pit != m_endpoints.end())
            {
                m_endpoints.erase(pit);
            }
            m_endpoints.erase(id);
        }

        static void add_waiter_(std::vector<TaskId> &waiters, TaskId task)
        {
            if (std::find(waiters.begin(), waiters.end(), task) == waiters.end())
            {
                waiters.push_back(task);
            }
        }

        static void remove_waiter_(std::vector<TaskId> &waiters, TaskId task)
        {
            waiters.erase(std::remove(waiters.begin(), waiters.end(), task), waiters.end());
        }

        void wake_all_(std::vector<TaskId> &waiters)
        {
            std::vector<TaskId> woken;
            woken.swap(waiters);
            if (!m_wake)
            {
                return;
            }
            for (TaskId t : woken)
            {
                m_wake(t);
            }
        }

        const VirtualClock &m_clock;
        EntropyManager &m_entropy;
        EventTrail &m_trail;
        WakeFn m_wake;

        LinkConfig m_defaultLink;
        std::map<std::pair<HostId, HostId>, LinkConfig> m_links;
        std::set<std::pair<HostId, HostId>> m_partitions;

        std::map<std::string, HostId> m_hostByName;
        std::map<HostId, std::string> m_nameByHost;
        std::map<HostId, std::uint16_t> m_ephemeral;

        std::map<ListenerId, Listener> m_listeners;
        std::map<std::pair<HostId, std::uint16_t>, ListenerId> m_listenerByAddr;
        std::map<ConnectionId, Endpoint> m_endpoints;

        std::map<std::pair<SimInstant, std::uint64_t>, InFlightMessage> m_inflight;

        ListenerId m_nextListener = 1;
        ConnectionId m_nextConnection = 1;
        std::uint64_t m_nextSendSeq = 1;

        NetworkStats m_stats{};
    };
}
