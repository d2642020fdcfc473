#include "kv_workload.hpp"
#include "simulation.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string_view>

namespace
{
    struct Params
    {
        std::uint64_t firstSeed = 1;
        std::uint64_t seeds = 20;
        int clients = 3;
        int rounds = 20;
        std::uint64_t faults = 6;
        bool durable = true;
        bool verbose = false;
    };

    bool parse_u64(std::string_view s, std::uint64_t &out)
    {
        unsigned long long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size())
        {
            return false;
        }
        out = static_cast<std::uint64_t>(v);
        return true;
    }

    bool parse_int(std::string_view s, int &out)
    {
        auto r = std::from_chars(s.data(), s.data() + s.size(), out);
        return r.ec == std::errc() && r.ptr == s.data() + s.size() && out > 0;
    }

    [[noreturn]] void usage_and_exit()
    {
        std::cerr << "Chaos key-value demo (seed sweep with determinism check)\n"
                  << "  --seed S        first seed (default: DETSIM_SEED or 1)\n"
                  << "  --seeds N       number of consecutive seeds\n"
                  << "  --clients C\n"
                  << "  --rounds R      write/read pairs per client\n"
                  << "  --faults F      chaos episodes per run\n"
                  << "  --volatile      server loses its data on crash\n"
                  << "  --verbose       log at INFO (otherwise DETSIM_LOG, default OFF)\n";
        std::exit(2);
    }

    Params parse_args(int argc, char **argv)
    {
        Params p;
        p.firstSeed = detsim::seed_from_env("DETSIM_SEED", 1);
        for (int i = 1; i < argc; ++i)
        {
            std::string_view a(argv[i]);
            auto need = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    usage_and_exit();
                }
                return std::string_view(argv[++i]);
            };

            if (a == "--seed")
            {
                if (!parse_u64(need(), p.firstSeed))
                    usage_and_exit();
            }
            else if (a == "--seeds")
            {
                if (!parse_u64(need(), p.seeds))
                    usage_and_exit();
            }
            else if (a == "--clients")
            {
                if (!parse_int(need(), p.clients))
                    usage_and_exit();
            }
            else if (a == "--rounds")
            {
                if (!parse_int(need(), p.rounds))
                    usage_and_exit();
            }
            else if (a == "--faults")
            {
                if (!parse_u64(need(), p.faults))
                    usage_and_exit();
            }
            else if (a == "--volatile")
            {
                p.durable = false;
            }
            else if (a == "--verbose")
            {
                p.verbose = true;
            }
            else
            {
                usage_and_exit();
            }
        }
        if (p.seeds == 0)
        {
            usage_and_exit();
        }
        return p;
    }
}

int main(int argc, char **argv)
{
    const Params p = parse_args(argc, argv);

    kv::Scenario sc;
    sc.clients = p.clients;
    sc.rounds = p.rounds;
    sc.durable = p.durable;
    sc.faults = static_cast<std::size_t>(p.faults);
    sc.logLevel = p.verbose ? detsim::LogLevel::Info : detsim::log_level_from_env("DETSIM_LOG", detsim::LogLevel::Off);

    int exitCode = 0;
    std::uint64_t failing = 0;
    for (std::uint64_t seed = p.firstSeed; seed < p.firstSeed + p.seeds; ++seed)
    {
        const kv::Result first = kv::run_scenario(seed, sc);
        const kv::Result second = kv::run_scenario(seed, sc);

        const detsim::RunReport &r = first.report;
        std::cout << "seed=" << seed
                  << " outcome=" << detsim::run_outcome_name(r.outcome)
                  << " t=" << r.finalInstant << "ns"
                  << " ops=" << first.stats.completedOps
                  << " retries=" << first.stats.retries
                  << " faults=" << r.appliedFaults.size()
                  << " digest=" << r.traceDigest << "\n";

        if (second.report.traceDigest != r.traceDigest || second.report.traceCount != r.traceCount)
        {
            std::cerr << "non-determinism detected for seed " << seed << ": digest " << r.traceDigest
                      << " vs " << second.report.traceDigest << "\n";
            exitCode = 3;
        }

        if (!r.ok())
        {
            ++failing;
            std::cerr << r.describe();
            if (exitCode == 0)
            {
                exitCode = 1;
            }
        }
    }

    std::cout << "seeds=" << p.seeds << " failing=" << failing << "\n";
    return exitCode;
}
