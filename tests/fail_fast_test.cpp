/*
Purpose: Regression test for task failure handling.

What this tests: An exception thrown by a task fails that task only. By default the
run carries on and the report lists the failure; with failFast the run stops at the
failing instant with RunOutcome::TaskFailed. Either way the report explains what
failed, where and when. Throwing something that is not a std::exception is
captured the same way.
*/

#include "simulation.hpp"

#include <cassert>
#include <stdexcept>
#include <string>

namespace
{
    detsim::HostEntry fail_after(detsim::SimDuration delay)
    {
        return [delay]()
        {
            return detsim::make_task("doomed", [sleep = detsim::SleepOp(delay)](detsim::HostContext &ctx) mutable
                                     {
                if (!sleep.poll(ctx))
                {
                    return detsim::TaskPoll::Pending;
                }
                throw std::runtime_error("invariant broken: balance went negative"); });
        };
    }

    detsim::HostEntry throw_int_after(detsim::SimDuration delay)
    {
        return [delay]()
        {
            return detsim::make_task("odd", [sleep = detsim::SleepOp(delay)](detsim::HostContext &ctx) mutable
                                     {
                if (!sleep.poll(ctx))
                {
                    return detsim::TaskPoll::Pending;
                }
                throw 42; });
        };
    }

    detsim::HostEntry sleep_for(detsim::SimDuration d)
    {
        return [d]()
        {
            return detsim::make_task("sleeper", [sleep = detsim::SleepOp(d)](detsim::HostContext &ctx) mutable
                                     { return sleep.poll(ctx) ? detsim::TaskPoll::Done : detsim::TaskPoll::Pending; });
        };
    }

    detsim::RunReport run(bool failFast)
    {
        detsim::SimulationConfig cfg;
        cfg.seed = 31337;
        cfg.failFast = failFast;
        cfg.enableInvariantChecks = true;

        detsim::Simulation sim(cfg);
        (void)sim.add_host("bank", fail_after(detsim::millis(10)));
        (void)sim.add_host("bystander", sleep_for(detsim::millis(100)));
        return sim.run();
    }
}

int main()
{
    {
        const detsim::RunReport report = run(false);
        assert(report.outcome == detsim::RunOutcome::Completed);
        assert(!report.ok());
        assert(report.finalInstant == detsim::millis(100));
        assert(report.failureInstant && *report.failureInstant == detsim::millis(10));

        assert(report.failures.size() == 1);
        const detsim::TaskFailure &f = report.failures.front();
        assert(f.taskName == "doomed");
        assert(f.at == detsim::millis(10));
        assert(f.message.find("balance went negative") != std::string::npos);
        assert(report.tasksCompleted == 1);

        const std::string text = report.describe();
        assert(text.find("DETSIM_SEED=31337") != std::string::npos);
        assert(text.find("bank(1)") != std::string::npos);
        assert(text.find("doomed") != std::string::npos);

        bool threw = false;
        try
        {
            report.throw_if_failed();
        }
        catch (const detsim::SimulationError &e)
        {
            threw = true;
            assert(e.outcome() == detsim::RunOutcome::TaskFailed);
        }
        assert(threw);
    }

    {
        const detsim::RunReport report = run(true);
        assert(report.outcome == detsim::RunOutcome::TaskFailed);
        assert(report.finalInstant == detsim::millis(10));
        assert(report.failureInstant && *report.failureInstant == detsim::millis(10));
        assert(report.failures.size() == 1);
        assert(report.tasksRemaining == 1);
    }

    {
        detsim::SimulationConfig cfg;
        cfg.enableInvariantChecks = true;
        detsim::Simulation sim(cfg);
        (void)sim.add_host("odd", throw_int_after(detsim::millis(5)));
        (void)sim.add_host("bystander", sleep_for(detsim::millis(20)));

        const detsim::RunReport report = sim.run();
        assert(report.outcome == detsim::RunOutcome::Completed);
        assert(report.finalInstant == detsim::millis(20));
        assert(report.failures.size() == 1);
        assert(report.failures.front().taskName == "odd");
        assert(report.failures.front().at == detsim::millis(5));
        assert(report.failures.front().message == "unknown exception");
        assert(report.tasksCompleted == 1);
        assert(report.tasksRemaining == 0);
    }

    return 0;
}
