#include "kv_workload.hpp"
#include "simulation.hpp"

#include <mpi.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string_view>
#include <vector>

// Spreads a range of seeds over MPI ranks. Every rank runs its share of the
// key-value chaos scenario independently; rank 0 collects the failing seeds
// and an order-independent fold of all trail digests.

namespace
{
    struct Params
    {
        std::uint64_t firstSeed = 1;
        std::uint64_t seeds = 256;
        bool durable = true;
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

    [[noreturn]] void usage_and_exit(int rank)
    {
        if (rank == 0)
        {
            std::cerr << "Seed sweep over MPI ranks\n"
                      << "  --seed S\n"
                      << "  --seeds N\n"
                      << "  --volatile\n";
        }
        MPI_Abort(MPI_COMM_WORLD, 2);
        std::exit(2);
    }

    Params parse_args(int argc, char **argv, int rank)
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
                    usage_and_exit(rank);
                }
                return std::string_view(argv[++i]);
            };

            if (a == "--seed")
            {
                if (!parse_u64(need(), p.firstSeed))
                    usage_and_exit(rank);
            }
            else if (a == "--seeds")
            {
                if (!parse_u64(need(), p.seeds))
                    usage_and_exit(rank);
            }
            else if (a == "--volatile")
            {
                p.durable = false;
            }
            else
            {
                usage_and_exit(rank);
            }
        }
        return p;
    }
}

int main(int argc, char **argv)
{
    int provided = 0;
    MPI_Init_thread(&argc, &argv, MPI_THREAD_SINGLE, &provided);
    int rank = 0;
    int size = 1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    const Params p = parse_args(argc, argv, rank);

    kv::Scenario sc;
    sc.durable = p.durable;

    std::vector<std::uint64_t> localFailing;
    std::uint64_t localHash = 0;
    for (std::uint64_t i = static_cast<std::uint64_t>(rank); i < p.seeds; i += static_cast<std::uint64_t>(size))
    {
        const std::uint64_t seed = p.firstSeed + i;
        const kv::Result result = kv::run_scenario(seed, sc);
        localHash ^= detsim::splitmix64(detsim::mix_u64(seed, result.report.traceDigest));
        if (!result.report.ok())
        {
            localFailing.push_back(seed);
            std::cerr << "[rank " << rank << "] " << result.report.describe();
        }
    }

    std::uint64_t globalHash = 0;
    MPI_Allreduce(&localHash, &globalHash, 1, MPI_UINT64_T, MPI_BXOR, MPI_COMM_WORLD);

    const int localCount = static_cast<int>(localFailing.size());
    std::vector<int> counts(rank == 0 ? static_cast<std::size_t>(size) : 0);
    MPI_Gather(&localCount, 1, MPI_INT, counts.data(), 1, MPI_INT, 0, MPI_COMM_WORLD);

    std::vector<int> displs;
    std::vector<std::uint64_t> allFailing;
    if (rank == 0)
    {
        displs.resize(static_cast<std::size_t>(size));
        int total = 0;
        for (int r = 0; r < size; ++r)
        {
            displs[static_cast<std::size_t>(r)] = total;
            total += counts[static_cast<std::size_t>(r)];
        }
        allFailing.resize(static_cast<std::size_t>(total));
    }
    MPI_Gatherv(localFailing.data(), localCount, MPI_UINT64_T,
                allFailing.data(), counts.data(), displs.data(), MPI_UINT64_T, 0, MPI_COMM_WORLD);

    if (rank == 0)
    {
        std::cout << "seeds=" << p.seeds << " ranks=" << size << " failing=" << allFailing.size()
                  << " sweep-hash=" << globalHash << "\n";
        for (std::uint64_t seed : allFailing)
        {
            std::cout << "  reproduce with DETSIM_SEED=" << seed << "\n";
        }
    }

    const int exitCode = allFailing.empty() ? 0 : 1;
    int globalExit = 0;
    MPI_Allreduce(&exitCode, &globalExit, 1, MPI_INT, MPI_MAX, MPI_COMM_WORLD);

    MPI_Finalize();
    return globalExit;
}
