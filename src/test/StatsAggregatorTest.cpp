#include <atomic>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include "application/StatsAggregator.hpp"
#include "application/WorkerPool.hpp"

using foldermapper::application::StatsAggregator;
using foldermapper::application::WorkerPool;

namespace {

void TestSingleThreaded() {
    std::cout << "[Test] Counters..." << std::endl;
    StatsAggregator stats;
    stats.recordFile(500, true);
    stats.recordFile(foldermapper::domain::kLargeFileThreshold + 1, true);
    stats.recordFile(foldermapper::domain::kLargeFileThreshold, true);
    stats.recordFile(4096, false);
    stats.recordDirectory(true);
    stats.recordDirectory(false);
    stats.recordError();
    stats.recordPermissionDenied();

    auto s = stats.snapshot();
    assert(s.processedFiles == 4);
    assert(s.processedFolders == 2);
    assert(s.emptyDirectories == 1);
    assert(s.largeFiles == 1);
    assert(s.errorsEncountered == 1);
    assert(s.permissionDenials == 1);
    assert(s.totalSizeBytes == 500 + 2 * foldermapper::domain::kLargeFileThreshold + 1);
}

void TestConcurrentIncrements() {
    std::cout << "[Test] Concurrent increments from 16 threads..." << std::endl;
    StatsAggregator stats;
    const int kThreads = 16;
    const int kPerThread = 2000;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&stats]() {
            for (int i = 0; i < kPerThread; ++i) {
                stats.recordFile(3, true);
                stats.recordDirectory(i % 2 == 0);
                if (i % 10 == 0) stats.recordError();
            }
        });
    }
    for (auto& t : threads) t.join();

    auto s = stats.snapshot();
    assert(s.processedFiles == static_cast<std::uint64_t>(kThreads) * kPerThread);
    assert(s.totalSizeBytes == static_cast<std::uint64_t>(kThreads) * kPerThread * 3);
    assert(s.processedFolders == static_cast<std::uint64_t>(kThreads) * kPerThread);
    assert(s.emptyDirectories == static_cast<std::uint64_t>(kThreads) * kPerThread / 2);
    assert(s.errorsEncountered == static_cast<std::uint64_t>(kThreads) * kPerThread / 10);
}

void TestWorkerPool() {
    std::cout << "[Test] WorkerPool barrier and failures..." << std::endl;
    bool threw = false;
    try {
        WorkerPool none(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    WorkerPool pool(4);
    assert(pool.WorkerCount() == 4);

    std::atomic<int> done{0};
    for (int round = 0; round < 3; ++round) {
        for (int i = 0; i < 100; ++i) {
            pool.Submit([&done] { ++done; });
        }
        pool.WaitIdle();
        assert(done.load() == (round + 1) * 100);
    }

    pool.Submit([] { throw std::runtime_error("boom"); });
    pool.WaitIdle();
    assert(pool.FailedTasks() == 1);
    assert(pool.LastFailure() == "boom");

    pool.Stop();
    pool.Stop();
    threw = false;
    try {
        pool.Submit([] {});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

// Runs in a child so the address-space limit does not leak into the other tests.
void TestThreadStartFailureIsRecoverable() {
    std::cout << "[Test] Failing to start workers throws instead of terminating..." << std::endl;
    pid_t pid = fork();
    assert(pid >= 0);
    if (pid == 0) {
        struct rlimit limit;
        limit.rlim_cur = 256UL * 1024 * 1024;
        limit.rlim_max = 256UL * 1024 * 1024;
        setrlimit(RLIMIT_AS, &limit);
        try {
            WorkerPool pool(1000);
        } catch (const std::exception&) {
            _exit(0);
        }
        _exit(0);
    }
    int status = 0;
    waitpid(pid, &status, 0);
    assert(WIFEXITED(status));
    assert(WEXITSTATUS(status) == 0);
}

} // namespace

int main() {
    TestSingleThreaded();
    TestConcurrentIncrements();
    TestWorkerPool();
    TestThreadStartFailureIsRecoverable();
    std::cout << "[PASS] StatsAggregatorTest" << std::endl;
    return 0;
}
