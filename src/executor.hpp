#pragma once

#include "clock.hpp"
#include "log.hpp"
#include "task.hpp"
#include "trace.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <stdexcept>

namespace detsim
{
    struct TaskFailure
    {
        TaskId task = 0;
        HostId host = 0;
        std::string taskName;
        SimInstant at = 0;
        std::string message;
    };

    // Single-threaded cooperative scheduler.
    //
    // Tasks live in an arena keyed by TaskId; everything else (timers, network
    // wait lists) refers to them by id only. The ready queue is strictly FIFO.
    class Executor
    {
    public:
        // Resumes one task. `first` is true on the task's first resume.
        using ResumeFn = std::function<TaskPoll(TaskId, HostId, ITask &, bool first)>;

        // Invoked whenever a task leaves the arena, to drop its timers and waits.
        using ReleaseFn = std::function<void(TaskId)>;

        Executor(const VirtualClock &clock, EventTrail &trail) : m_clock(clock), m_trail(trail) {}

        void set_release_hook(ReleaseFn fn) { m_onRelease = std::move(fn); }

        // Stop draining as soon as any task has failed.
        void set_stop_on_failure(bool on) { m_stopOnFailure = on; }

        TaskId spawn(HostId host, std::unique_ptr<ITask> task, bool foreground)
        {
            if (!task)
            {
                throw std::runtime_error("Executor::spawn: null task");
            }
            const TaskId id = m_nextId++;
            TaskSlot slot;
            slot.name = task->name();
            slot.task = std::move(task);
            slot.host = host;
            slot.foreground = foreground;
            slot.state = TaskState::Ready;
            m_tasks.emplace(id, std::move(slot));
            m_ready.push_back(id);

            m_trail.record(TraceRecord{m_clock.now(), TraceKind::TaskSpawn, host, 0, id, foreground ? 1u : 0u});
            return id;
        }

        // Suspended -> Ready. A wake that lands while the task is running is
        // remembered and re-queues it once it yields. Anything else is ignored.
        void wake(TaskId id)
        {
            auto it = m_tasks.find(id);
            if (it == m_tasks.end())
            {
                return;
            }
            TaskSlot &slot = it->second;
            if (slot.state == TaskState::Suspended)
            {
                slot.state = TaskState::Ready;
                m_ready.push_back(id);
            }
            else if (slot.state == TaskState::Running)
            {
                slot.wokenWhileRunning = true;
            }
        }

        // Synchronous: when this returns, the task is gone and no timer or wait
        // registration refers to it. A running task is cancelled when it yields.
        bool cancel(TaskId id)
        {
            auto it = m_tasks.find(id);
            if (it == m_tasks.end())
            {
                return false;
            }
            if (it->second.state == TaskState::Running)
            {
                it->second.cancelRequested = true;
                return true;
            }
            it->second.task->on_cancel();
            finish_(id, TaskState::Cancelled, {});
            return true;
        }

        std::size_t cancel_host(HostId host)
        {
            const auto ids = tasks_of(host);
            for (TaskId id : ids)
            {
                cancel(id);
            }
            return ids.size();
        }

        // Runs ready tasks in FIFO order until the queue is empty. Returns the
        // number of resumes performed.
        std::size_t drain(const ResumeFn &resume)
        {
            std::size_t resumed = 0;
            while (!m_ready.empty())
            {
                if (m_stopOnFailure && !m_failures.empty())
                {
                    break;
                }

                const TaskId id = m_ready.front();
                m_ready.pop_front();

                auto it = m_tasks.find(id);
                if (it == m_tasks.end() || it->second.state != TaskState::Ready)
                {
                    continue;
                }

                TaskSlot &slot = it->second;
                slot.state = TaskState::Running;
                slot.wokenWhileRunning = false;
                const bool first = !slot.started;
                slot.started = true;

                TaskPoll poll = TaskPoll::Pending;
                std::optional<std::string> error;
                try
                {
                    poll = resume(id, slot.host, *slot.task, first);
                }
                catch (const std::exception &e)
                {
                    error = e.what();
                }
                catch (...)
                {
                    error = "unknown exception";
                }
                ++resumed;
                ++m_totalResumes;

                TaskSlot &after = m_tasks.at(id);
                if (error)
                {
                    finish_(id, TaskState::Failed, *error);
                }
                else if (poll == TaskPoll::Done)
                {
                    finish_(id, TaskState::Completed, {});
                }
                else if (after.cancelRequested)
                {
                    after.task->on_cancel();
                    finish_(id, TaskState::Cancelled, {});
                }
                else if (after.wokenWhileRunning)
                {
                    after.state = TaskState::Ready;
                    m_ready.push_back(id);
                }
                else
                {
                    after.state = TaskState::Suspended;
                }
            }
            return resumed;
        }

        bool has_ready() const noexcept { return !m_ready.empty(); }

        std::size_t live() const noexcept { return m_tasks.size(); }

        std::size_t live_foreground() const noexcept
        {
            std::size_t n = 0;
            for (const auto &[id, slot] : m_tasks)
            {
                (void)id;
                n += slot.foreground ? 1 : 0;
            }
            return n;
        }

        std::vector<TaskId> tasks_of(HostId host) const
        {
            std::vector<TaskId> out;
            for (const auto &[id, slot] : m_tasks)
            {
                if (slot.host == host)
                {
                    out.push_back(id);
                }
            }
            return out;
        }

        std::optional<TaskState> state_of(TaskId id) const
        {
            auto it = m_tasks.find(id);
            if (it == m_tasks.end())
            {
                return std::nullopt;
            }
            return it->second.state;
        }

        std::optional<HostId> host_of(TaskId id) const
        {
            auto it = m_tasks.find(id);
            if (it == m_tasks.end())
            {
                return std::nullopt;
            }
            return it->second.host;
        }

        const std::vector<TaskFailure> &failures() const noexcept { return m_failures; }

        std::uint64_t completed() const noexcept { return m_completed; }
        std::uint64_t cancelled() const noexcept { return m_cancelled; }
        std::uint64_t total_resumes() const noexcept { return m_totalResumes; }

        // A queued id either names a task that is gone (skipped when popped) or
        // one in the Ready state. Used by the orchestrator's invariant checks.
        bool ready_queue_consistent() const
        {
            for (TaskId id : m_ready)
            {
                auto it = m_tasks.find(id);
                if (it != m_tasks.end() && it->second.state != TaskState::Ready)
                {
                    return false;
                }
            }
            return true;
        }

    private:
        struct TaskSlot
        {
            std::unique_ptr<ITask> task;
            std::string name;
            HostId host = 0;
            TaskState state = TaskState::Ready;
            bool foreground = false;
            bool started = false;
            bool wokenWhileRunning = false;
            bool cancelRequested = false;
        };

        void finish_(TaskId id, TaskState state, const std::string &why)
        {
            auto it = m_tasks.find(id);
            if (it == m_tasks.end())
            {
                return;
            }
            const HostId host = it->second.host;
            const SimInstant now = m_clock.now();

            switch (state)
            {
            case TaskState::Completed:
                ++m_completed;
                m_trail.record(TraceRecord{now, TraceKind::TaskComplete, host, 0, id, 0});
                break;
            case TaskState::Failed:
                m_failures.push_back(TaskFailure{id, host, it->second.name, now, why});
                m_trail.record(TraceRecord{now, TraceKind::TaskFail, host, 0, id, 0});
                Logger::instance().logf(LogLevel::Warn, host, now, "task %llu (%s) failed: %s",
                                        static_cast<unsigned long long>(id), it->second.name.c_str(), why.c_str());
                break;
            case TaskState::Cancelled:
                ++m_cancelled;
                m_trail.record(TraceRecord{now, TraceKind::TaskCancel, host, 0, id, 0});
                break;
            default:
                throw std::logic_error("Executor::finish_: non-terminal state");
            }

            m_tasks.erase(it);
            if (m_onRelease)
            {
                m_onRelease(id);
            }
        }

        const VirtualClock &m_clock;
        EventTrail &m_trail;
        ReleaseFn m_onRelease;
        bool m_stopOnFailure = false;

        std::map<TaskId, TaskSlot> m_tasks;
        std::deque<TaskId> m_ready;
        TaskId m_nextId = 1;

        std::vector<TaskFailure> m_failures;
        std::uint64_t m_completed = 0;
        std::uint64_t m_cancelled = 0;
        std::uint64_t m_totalResumes = 0;
    };
}
