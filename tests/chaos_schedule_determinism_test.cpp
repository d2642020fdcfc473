/*
Purpose: Regression test for chaos schedule generation.

What this tests: A chaos schedule is a pure function of the entropy stream and the
configuration; every onset has a matching recovery inside the window; only enabled
fault kinds appear; and the simulation draws its schedule from the runtime's own
stream, so equal seeds give equal schedules.
*/

#include "fault.hpp"
#include "simulation.hpp"

#include <cassert>
#include <map>
#include <stdexcept>
#include <vector>

namespace
{
    bool same(const detsim::TimedFault &x, const detsim::TimedFault &y)
    {
        return x.at == y.at && x.fault.kind == y.fault.kind && x.fault.a == y.fault.a && x.fault.b == y.fault.b &&
               x.fault.minLatency == y.fault.minLatency && x.fault.maxLatency == y.fault.maxLatency &&
               x.fault.lossRate == y.fault.lossRate && x.fault.skew == y.fault.skew;
    }

    detsim::ChaosConfig config()
    {
        detsim::ChaosConfig cfg;
        cfg.faultCount = 40;
        cfg.start = detsim::seconds(1);
        cfg.duration = detsim::seconds(5);
        cfg.hosts = {1, 2, 3, 4};
        return cfg;
    }
}

int main()
{
    const detsim::ChaosConfig cfg = config();

    detsim::EntropyStream r1(555);
    detsim::EntropyStream r2(555);
    const auto a = detsim::generate_chaos(r1, cfg);
    const auto b = detsim::generate_chaos(r2, cfg);

    assert(a.size() == 80);
    assert(a.size() == b.size());
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        assert(same(a[i], b[i]));
    }

    std::map<detsim::FaultKind, int> counts;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const auto &tf = a[i];
        assert(tf.at >= cfg.start && tf.at <= cfg.start + static_cast<detsim::SimInstant>(cfg.duration));
        if (i > 0)
        {
            assert(a[i - 1].at <= tf.at);
        }
        ++counts[tf.fault.kind];

        switch (tf.fault.kind)
        {
        case detsim::FaultKind::Partition:
        case detsim::FaultKind::Heal:
        case detsim::FaultKind::LatencyChange:
        case detsim::FaultKind::LossChange:
            assert(tf.fault.a != tf.fault.b);
            break;
        default:
            break;
        }
        if (tf.fault.kind == detsim::FaultKind::LatencyChange)
        {
            assert(tf.fault.minLatency >= 0 && tf.fault.minLatency <= tf.fault.maxLatency);
            assert(tf.fault.maxLatency <= cfg.maxLatency);
        }
        if (tf.fault.kind == detsim::FaultKind::LossChange)
        {
            assert(tf.fault.lossRate >= 0.0 && tf.fault.lossRate <= cfg.maxLossRate);
        }
        if (tf.fault.kind == detsim::FaultKind::ClockSkew)
        {
            assert(tf.fault.skew >= -cfg.maxSkew && tf.fault.skew <= cfg.maxSkew);
        }
    }
    assert(counts[detsim::FaultKind::Partition] == counts[detsim::FaultKind::Heal]);
    assert(counts[detsim::FaultKind::Crash] == counts[detsim::FaultKind::Restart]);
    assert(counts[detsim::FaultKind::LatencyChange] % 2 == 0);
    assert(counts[detsim::FaultKind::LossChange] % 2 == 0);
    assert(counts[detsim::FaultKind::ClockSkew] % 2 == 0);

    // Only what is enabled.
    {
        detsim::ChaosConfig only = config();
        only.allowLatency = false;
        only.allowLoss = false;
        only.allowCrash = false;
        only.allowSkew = false;
        detsim::EntropyStream r(1);
        for (const auto &tf : detsim::generate_chaos(r, only))
        {
            assert(tf.fault.kind == detsim::FaultKind::Partition || tf.fault.kind == detsim::FaultKind::Heal);
        }
    }

    // Link faults need two hosts; with one host and only link faults enabled there is nothing to do.
    {
        detsim::ChaosConfig lonely = config();
        lonely.hosts = {1};
        lonely.allowCrash = false;
        lonely.allowSkew = false;
        detsim::EntropyStream r(1);
        bool threw = false;
        try
        {
            (void)detsim::generate_chaos(r, lonely);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    // Through the simulation: the schedule follows the master seed.
    {
        const auto plan = [](std::uint64_t seed)
        {
            detsim::SimulationConfig sc;
            sc.seed = seed;
            detsim::Simulation sim(sc);
            for (const char *name : {"n1", "n2", "n3"})
            {
                (void)sim.add_host(name, []()
                                   { return detsim::make_task("idle", [](detsim::HostContext &)
                                                              { return detsim::TaskPoll::Done; }); });
            }
            detsim::ChaosConfig cc;
            cc.faultCount = 10;
            assert(sim.schedule_chaos(cc) == 20);
            return sim.faults().history();
        };

        const auto x = plan(8);
        const auto y = plan(8);
        const auto z = plan(9);
        assert(x.size() == 20 && y.size() == 20 && z.size() == 20);
        bool allSame = true;
        bool anyDiff = false;
        for (std::size_t i = 0; i < x.size(); ++i)
        {
            allSame = allSame && same(detsim::TimedFault{x[i].at, x[i].fault}, detsim::TimedFault{y[i].at, y[i].fault});
            anyDiff = anyDiff || !same(detsim::TimedFault{x[i].at, x[i].fault}, detsim::TimedFault{z[i].at, z[i].fault});
        }
        assert(allSame);
        assert(anyDiff);
    }

    return 0;
}
