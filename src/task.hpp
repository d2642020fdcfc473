#pragma once

#include "common.hpp"

#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>

namespace detsim
{
    class HostContext;

    enum class TaskPoll : std::uint8_t
    {
        // The task registered a wake condition and wants to be resumed later.
        Pending = 0,
        // The task finished.
        Done = 1,
    };

    enum class TaskState : std::uint8_t
    {
        Ready = 0,
        Running = 1,
        Suspended = 2,
        Completed = 3,
        Failed = 4,
        Cancelled = 5,
    };

    inline const char *task_state_name(TaskState s) noexcept
    {
        switch (s)
        {
        case TaskState::Ready:
            return "ready";
        case TaskState::Running:
            return "running";
        case TaskState::Suspended:
            return "suspended";
        case TaskState::Completed:
            return "completed";
        case TaskState::Failed:
            return "failed";
        case TaskState::Cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    // A unit of host logic, written as an explicit state machine.
    //
    // resume() runs until the task either finishes (Done) or has to wait
    // (Pending). Waiting is only legal right after an operation in context.hpp
    // reported "not ready": that call registered the wake condition. Throwing
    // from resume() fails this task only.
    class ITask
    {
    public:
        virtual ~ITask() = default;

        // Called once, right before the first resume().
        virtual void on_start(HostContext &) {}

        virtual TaskPoll resume(HostContext &ctx) = 0;

        // Called when the task is torn down before finishing (host crash, explicit
        // cancel). Must not touch the simulation.
        virtual void on_cancel() {}

        virtual std::string name() const { return "task"; }
    };

    // Builds a fresh task for a host. Restart calls it again, so any state a
    // factory captures survives a crash; state inside the task does not.
    using HostEntry = std::function<std::unique_ptr<ITask>()>;

    // Adapts a callable holding its own state into a task.
    class FnTask final : public ITask
    {
    public:
        using Fn = std::function<TaskPoll(HostContext &)>;

        FnTask(std::string name, Fn fn) : m_name(std::move(name)), m_fn(std::move(fn))
        {
            if (!m_fn)
            {
                throw std::runtime_error("FnTask: null function");
            }
        }

        TaskPoll resume(HostContext &ctx) override { return m_fn(ctx); }

        std::string name() const override { return m_name; }

    private:
        std::string m_name;
        Fn m_fn;
    };

    inline std::unique_ptr<ITask> make_task(std::string name, FnTask::Fn fn)
    {
        return std::make_unique<FnTask>(std::move(name), std::move(fn));
    }
}
