/*
Purpose: Regression test for trail replay.

What this tests: A trail recorded from one run, encoded and decoded, is accepted
as the expected trail of a second run with the same seed. A trail altered at one
record, or one that is longer than what the run produces, makes the run stop with
RunOutcome::ReplayDivergence and reports the index of the first mismatch.
*/

#include "echo_hosts.hpp"
#include "simulation.hpp"
#include "trace.hpp"

#include <cassert>
#include <optional>
#include <vector>

namespace
{
    detsim::RunReport run(std::optional<std::vector<detsim::TraceRecord>> expected)
    {
        detsim::SimulationConfig cfg;
        cfg.seed = 2024;
        cfg.defaultLink = detsim::LinkConfig{detsim::millis(2), detsim::millis(30), 0.2};
        cfg.recordTrail = true;
        cfg.expectedTrail = std::move(expected);
        cfg.enableInvariantChecks = true;

        detsim::Simulation sim(cfg);
        (void)sim.add_host("server", detsim_test::echo_server());
        (void)sim.add_client("alpha", detsim_test::chatter(10, detsim::millis(100)));
        (void)sim.add_client("beta", detsim_test::chatter(10, detsim::millis(100)));
        return sim.run();
    }
}

int main()
{
    const detsim::RunReport original = run(std::nullopt);
    assert(original.ok());
    assert(!original.divergenceIndex);
    assert(original.trail.size() > 10);

    const detsim::ByteBuffer encoded = detsim::encode_trail(original.trail);
    const std::vector<detsim::TraceRecord> decoded = detsim::decode_trail(encoded);
    assert(decoded == original.trail);

    // Faithful replay.
    {
        const detsim::RunReport replay = run(decoded);
        assert(replay.ok());
        assert(!replay.divergenceIndex);
        assert(replay.traceDigest == original.traceDigest);
    }

    // One record altered in the middle.
    {
        std::vector<detsim::TraceRecord> tampered = decoded;
        const std::size_t k = tampered.size() / 2;
        tampered[k].b ^= 1;

        const detsim::RunReport replay = run(tampered);
        assert(replay.outcome == detsim::RunOutcome::ReplayDivergence);
        assert(replay.divergenceIndex && *replay.divergenceIndex == k);
        assert(replay.failureInstant && *replay.failureInstant == decoded[k].at);
        assert(replay.describe().find("replay diverged at trail record #" + std::to_string(k)) != std::string::npos);
    }

    // Expected trail ends early: the first extra record is the divergence.
    {
        std::vector<detsim::TraceRecord> shorter = decoded;
        shorter.pop_back();

        const detsim::RunReport replay = run(shorter);
        assert(replay.outcome == detsim::RunOutcome::ReplayDivergence);
        assert(replay.divergenceIndex && *replay.divergenceIndex == shorter.size());
    }

    // Expected trail runs past the end of the actual run.
    {
        std::vector<detsim::TraceRecord> longer = decoded;
        longer.push_back(decoded.back());

        const detsim::RunReport replay = run(longer);
        assert(replay.outcome == detsim::RunOutcome::ReplayDivergence);
        assert(replay.divergenceIndex && *replay.divergenceIndex == decoded.size());
    }

    return 0;
}
