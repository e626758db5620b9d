#include <benchmark/benchmark.h>

#include <mutex>
#include <shared_mutex>

#include "duolock/shared_spinlock.hpp"
#include "duolock/spin_mutex.hpp"
#include "duolock/testing.hpp"

using duo::testing::LockInspector;

constinit static duo::AtomicGate gBringupGate;
constinit static duo::AtomicGate gRawGate;

constinit static duo::SpinMutex<uint64_t> gBringupCounter { gBringupGate };
constinit static duo::SpinMutex<uint64_t> gRawCounter { gRawGate };

static std::mutex gStdMutex;
static uint64_t gStdCounter = 0;

static duo::SpinRwLock gRwLock;
static std::shared_mutex gStdRwLock;

/// @brief Baseline benchmark
static void BM_StdMutex(benchmark::State& state) {
    for (auto _ : state) {
        std::lock_guard guard(gStdMutex);
        benchmark::DoNotOptimize(gStdCounter += 1);
    }
}

BENCHMARK(BM_StdMutex)->ThreadRange(1, 8);

static void BM_SpinMutexBringup(benchmark::State& state) {
    for (auto _ : state) {
        auto guard = gBringupCounter.lock();
        benchmark::DoNotOptimize(*guard += 1);
    }
}

BENCHMARK(BM_SpinMutexBringup);

static void BM_SpinMutexRawSetup(const benchmark::State&) {
    LockInspector::enableGate(gRawGate);
}

static void BM_SpinMutexRaw(benchmark::State& state) {
    for (auto _ : state) {
        auto guard = gRawCounter.lock();
        benchmark::DoNotOptimize(*guard += 1);
    }
}

BENCHMARK(BM_SpinMutexRaw)
    ->Setup(BM_SpinMutexRawSetup)
    ->ThreadRange(1, 8);

static void BM_SpinRwLockShared(benchmark::State& state) {
    for (auto _ : state) {
        duo::SharedLock guard(gRwLock);
        benchmark::ClobberMemory();
    }
}

BENCHMARK(BM_SpinRwLockShared)->ThreadRange(1, 8);

static void BM_SpinRwLockExclusive(benchmark::State& state) {
    for (auto _ : state) {
        duo::UniqueLock guard(gRwLock);
        benchmark::ClobberMemory();
    }
}

BENCHMARK(BM_SpinRwLockExclusive)->ThreadRange(1, 8);

static void BM_StdSharedMutexShared(benchmark::State& state) {
    for (auto _ : state) {
        std::shared_lock guard(gStdRwLock);
        benchmark::ClobberMemory();
    }
}

BENCHMARK(BM_StdSharedMutexShared)->ThreadRange(1, 8);
