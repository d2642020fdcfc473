/*
Purpose: Unit test for the executor's ready queue.

What this tests: Ready tasks run strictly in FIFO order; a task that yields goes to
the back of the queue; a task spawned mid-drain runs after everything already
queued; a throwing task fails alone; cancelling a suspended task releases it at once.
*/

#include "context.hpp"
#include "executor.hpp"
#include "network.hpp"

#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
    struct Rig
    {
        detsim::VirtualClock clock;
        detsim::EventTrail trail;
        detsim::EntropyManager entropy{1};
        detsim::SimNetwork net{clock, entropy, trail, detsim::LinkConfig{}};
        detsim::Executor exec{clock, trail};
        std::vector<detsim::TaskId> released;

        Rig()
        {
            net.register_host(1, "h");
            exec.set_release_hook([this](detsim::TaskId t)
                                  {
                released.push_back(t);
                clock.cancel_owned(t); });
        }

        std::size_t drain()
        {
            const detsim::SimServices services{clock, entropy, net, exec};
            return exec.drain([&](detsim::TaskId id, detsim::HostId host, detsim::ITask &task, bool first)
                              {
                detsim::HostContext ctx(services, host, id);
                if (first)
                {
                    task.on_start(ctx);
                }
                return task.resume(ctx); });
        }
    };

    // Logs its label, yields `yields` times, then finishes.
    std::unique_ptr<detsim::ITask> yielder(std::string label, int yields, std::vector<std::string> *log)
    {
        return detsim::make_task(label, [label, yields, log, done = 0, y = detsim::YieldOp()](detsim::HostContext &ctx) mutable
                                 {
            while (true)
            {
                if (done == 0 || y.poll(ctx))
                {
                    log->push_back(label + std::to_string(done));
                    if (done == yields)
                    {
                        return detsim::TaskPoll::Done;
                    }
                    ++done;
                    y.reset();
                }
                if (!y.poll(ctx))
                {
                    return detsim::TaskPoll::Pending;
                }
            } });
    }
}

int main()
{
    // Round robin through yields.
    {
        Rig rig;
        std::vector<std::string> log;
        (void)rig.exec.spawn(1, yielder("a", 2, &log), true);
        (void)rig.exec.spawn(1, yielder("b", 1, &log), true);
        (void)rig.exec.spawn(1, yielder("c", 0, &log), false);
        assert(rig.exec.live() == 3);
        assert(rig.exec.live_foreground() == 2);

        (void)rig.drain();
        const std::vector<std::string> expected{"a0", "b0", "c0", "a1", "b1", "a2"};
        assert(log == expected);
        assert(rig.exec.live() == 0);
        assert(rig.exec.completed() == 3);
        assert(!rig.exec.has_ready());
        assert((rig.released == std::vector<detsim::TaskId>{3, 2, 1}));
    }

    // Spawn during a drain lands behind the current queue.
    {
        Rig rig;
        std::vector<std::string> log;
        (void)rig.exec.spawn(1, detsim::make_task("parent", [&log](detsim::HostContext &ctx)
                                                  {
            log.push_back("parent");
            (void)ctx.spawn(detsim::make_task("child", [&log](detsim::HostContext &)
                                              {
                log.push_back("child");
                return detsim::TaskPoll::Done; }));
            return detsim::TaskPoll::Done; }),
                             false);
        (void)rig.exec.spawn(1, detsim::make_task("sibling", [&log](detsim::HostContext &)
                                                  {
            log.push_back("sibling");
            return detsim::TaskPoll::Done; }),
                             false);

        (void)rig.drain();
        assert((log == std::vector<std::string>{"parent", "sibling", "child"}));
    }

    // Failure is local to the task.
    {
        Rig rig;
        bool otherRan = false;
        const auto bad = rig.exec.spawn(1, detsim::make_task("bad", [](detsim::HostContext &) -> detsim::TaskPoll
                                                             { throw std::runtime_error("boom"); }),
                                        false);
        (void)rig.exec.spawn(1, detsim::make_task("good", [&otherRan](detsim::HostContext &)
                                                  {
            otherRan = true;
            return detsim::TaskPoll::Done; }),
                             false);
        (void)rig.drain();
        assert(otherRan);
        assert(rig.exec.failures().size() == 1);
        assert(rig.exec.failures()[0].task == bad);
        assert(rig.exec.failures()[0].message == "boom");
        assert(!rig.exec.state_of(bad));
    }

    // Cancelling a sleeping task drops its timer through the release hook.
    {
        Rig rig;
        const auto sleeper = rig.exec.spawn(1, detsim::make_task("sleeper", [s = detsim::SleepOp(detsim::seconds(1))](detsim::HostContext &ctx) mutable
                                                                 { return s.poll(ctx) ? detsim::TaskPoll::Done : detsim::TaskPoll::Pending; }),
                                            false);
        (void)rig.drain();
        assert(rig.exec.state_of(sleeper) == detsim::TaskState::Suspended);
        assert(rig.clock.pending() == 1);
        assert(rig.exec.ready_queue_consistent());

        assert(rig.exec.cancel(sleeper));
        assert(!rig.exec.state_of(sleeper));
        assert(rig.clock.pending() == 0);
        assert(rig.exec.cancelled() == 1);
        assert(!rig.exec.cancel(sleeper));

        // Waking a task that no longer exists is harmless.
        rig.exec.wake(sleeper);
        assert(!rig.exec.has_ready());
    }

    return 0;
}
