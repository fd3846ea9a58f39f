/**
 * @file path_registry_bench.cpp
 * @brief Google Benchmark suite for the path registry
 *
 * Benchmarks:
 * - Pairing one sender with n receivers, both arrival orders
 * - Rejection fast path
 * - Contended registration from several threads
 */

#include <benchmark/benchmark.h>
#include "../../src/cpp/relay/path_registry.h"

#include <string>
#include <vector>

using namespace piping::relay;

using Registry = BasicPathRegistry<int, int>;

static std::vector<std::string> make_paths(size_t count) {
    std::vector<std::string> paths;
    paths.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        paths.push_back("/transfer/" + std::to_string(i));
    }
    return paths;
}

// =============================================================================
// Pairing
// =============================================================================

static void BM_Registry_SenderFirst(benchmark::State& state) {
    Registry registry;
    auto paths = make_paths(1024);
    uint32_t n = static_cast<uint32_t>(state.range(0));
    size_t i = 0;

    for (auto _ : state) {
        const std::string& path = paths[i++ & 1023];
        registry.register_sender(path, 1, n);
        Registry::Registration last;
        for (uint32_t r = 0; r < n; ++r) {
            last = registry.register_receiver(path, static_cast<int>(r));
        }
        benchmark::DoNotOptimize(last.committed());
        registry.release(path);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Registry_SenderFirst)->Arg(1)->Arg(4)->Arg(16);

static void BM_Registry_ReceiversFirst(benchmark::State& state) {
    Registry registry;
    auto paths = make_paths(1024);
    uint32_t n = static_cast<uint32_t>(state.range(0));
    size_t i = 0;

    for (auto _ : state) {
        const std::string& path = paths[i++ & 1023];
        for (uint32_t r = 0; r < n; ++r) {
            registry.register_receiver(path, static_cast<int>(r), n);
        }
        auto reg = registry.register_sender(path, 1, n);
        benchmark::DoNotOptimize(reg.committed());
        registry.release(path);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Registry_ReceiversFirst)->Arg(1)->Arg(4)->Arg(16);

static void BM_Registry_RejectSecondSender(benchmark::State& state) {
    Registry registry;
    registry.register_sender("/busy", 1, 1);

    for (auto _ : state) {
        auto reg = registry.register_sender("/busy", 2, 1);
        benchmark::DoNotOptimize(reg.rejected());
    }
}
BENCHMARK(BM_Registry_RejectSecondSender);

static void BM_Registry_ReservedPath(benchmark::State& state) {
    Registry registry(std::vector<std::string>{"/", "/noscript", "/version", "/help",
                                               "/robots.txt", "/favicon.ico"});

    for (auto _ : state) {
        auto reg = registry.register_sender("/help", 1, 1);
        benchmark::DoNotOptimize(reg.reason);
    }
}
BENCHMARK(BM_Registry_ReservedPath);

// =============================================================================
// Contention
// =============================================================================

static Registry g_shared_registry;

static void BM_Registry_Contended(benchmark::State& state) {
    // Each thread owns its own block of paths; only the mutex is shared.
    auto paths = make_paths(64);
    std::string prefix = "/t" + std::to_string(state.thread_index()) + "/";
    for (auto& path : paths) {
        path = prefix + path;
    }
    size_t i = 0;

    for (auto _ : state) {
        const std::string& path = paths[i++ & 63];
        g_shared_registry.register_sender(path, 1, 1);
        auto reg = g_shared_registry.register_receiver(path, 2);
        benchmark::DoNotOptimize(reg.committed());
        g_shared_registry.release(path);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Registry_Contended)->Threads(1)->Threads(4)->Threads(8);

BENCHMARK_MAIN();
