#pragma once

#include "common.hpp"

#include <stdexcept>

namespace detsim
{
    // Virtual clock and timer queue.
    //
    // Time only moves in advance_to(), which the orchestrator calls between
    // drains. Timers fire in (deadline, handle) order; handles are allocated
    // monotonically, so equal deadlines fire in creation order.
    class VirtualClock
    {
    public:
        struct FiredTimer
        {
            TimerHandle handle = 0;
            TaskId owner = 0;
            SimInstant deadline = 0;
        };

        SimInstant now() const noexcept { return m_now; }

        // The instant as observed by `host`, including any injected skew.
        SimInstant now_for(HostId host) const noexcept
        {
            return apply_skew(m_now, skew_of(host));
        }

        void set_skew(HostId host, SimDuration offset)
        {
            if (offset == 0)
            {
                m_skew.erase(host);
                return;
            }
            m_skew[host] = offset;
        }

        SimDuration skew_of(HostId host) const noexcept
        {
            auto it = m_skew.find(host);
            return (it == m_skew.end()) ? 0 : it->second;
        }

        // Zero and negative delays are due at the current instant and fire on
        // the next advance step (which may not move time at all).
        TimerHandle schedule(SimDuration delay, TaskId owner)
        {
            return schedule_at(instant_after(m_now, delay), owner);
        }

        TimerHandle schedule_at(SimInstant deadline, TaskId owner)
        {
            const TimerHandle h = m_nextHandle++;
            const SimInstant d = std::max(deadline, m_now);
            m_queue.emplace(TimerKey{d, h}, owner);
            m_byHandle.emplace(h, TimerEntry{d, owner});
            return h;
        }

        bool cancel(TimerHandle h)
        {
            auto it = m_byHandle.find(h);
            if (it == m_byHandle.end())
            {
                return false;
            }
            m_queue.erase(TimerKey{it->second.deadline, h});
            m_byHandle.erase(it);
            return true;
        }

        // Drops every timer owned by `owner`. Returns how many were removed.
        std::size_t cancel_owned(TaskId owner)
        {
            std::size_t n = 0;
            for (auto it = m_byHandle.begin(); it != m_byHandle.end();)
            {
                if (it->second.owner == owner)
                {
                    m_queue.erase(TimerKey{it->second.deadline, it->first});
                    it = m_byHandle.erase(it);
                    ++n;
                }
                else
                {
                    ++it;
                }
            }
            return n;
        }

        bool is_pending(TimerHandle h) const { return m_byHandle.count(h) != 0; }

        std::size_t pending() const noexcept { return m_queue.size(); }

        std::optional<SimInstant> next_deadline() const
        {
            if (m_queue.empty())
            {
                return std::nullopt;
            }
            return m_queue.begin()->first.deadline;
        }

        // Moves time to `instant` and returns every timer due at or before it.
        std::vector<FiredTimer> advance_to(SimInstant instant)
        {
            if (instant < m_now)
            {
                throw std::logic_error("VirtualClock::advance_to: time cannot move backwards");
            }
            m_now = instant;

            std::vector<FiredTimer> fired;
            while (!m_queue.empty() && m_queue.begin()->first.deadline <= m_now)
            {
                auto it = m_queue.begin();
                fired.push_back(FiredTimer{it->first.handle, it->second, it->first.deadline});
                m_byHandle.erase(it->first.handle);
                m_queue.erase(it);
            }
            return fired;
        }

    private:
        struct TimerKey
        {
            SimInstant deadline = 0;
            TimerHandle handle = 0;

            friend bool operator<(const TimerKey &lhs, const TimerKey &rhs) noexcept
            {
                return (lhs.deadline < rhs.deadline) || ((lhs.deadline == rhs.deadline) && (lhs.handle < rhs.handle));
            }
        };

        struct TimerEntry
        {
            SimInstant deadline = 0;
            TaskId owner = 0;
        };

        SimInstant m_now = 0;
        TimerHandle m_nextHandle = 1;
        std::map<TimerKey, TaskId> m_queue;
        std::map<TimerHandle, TimerEntry> m_byHandle;
        std::map<HostId, SimDuration> m_skew;
    };
}
