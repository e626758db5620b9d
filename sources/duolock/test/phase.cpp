#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <set>

#include "duolock/phase.hpp"
#include "duolock/spin_mutex.hpp"
#include "duolock/testing.hpp"

using duo::testing::LockInspector;

class SmpPhaseTest : public testing::Test {
public:
    duo::AtomicGate gate;
};

TEST_F(SmpPhaseTest, LaunchRunsEveryWorker) {
    duo::SmpPhase smp = duo::BringupPhase(gate).enterSmp();

    std::atomic<unsigned> mask = 0;
    duo::Status status = smp.launch({ .workers = 4 }, [&](unsigned index) {
        mask.fetch_or(1u << index);
    });

    ASSERT_EQ(status, duo::StatusSuccess);
    EXPECT_EQ(smp.getWorkerCount(), 4u);
    EXPECT_EQ(smp.join(), 4u);
    EXPECT_EQ(mask.load(), 0b1111u);
    EXPECT_EQ(smp.getWorkerCount(), 0u);
}

TEST_F(SmpPhaseTest, LaunchRejectsZeroWorkers) {
    duo::SmpPhase smp = duo::BringupPhase(gate).enterSmp();

    duo::Status status = smp.launch({ .workers = 0 }, [](unsigned) { });
    EXPECT_EQ(status, duo::StatusInvalidInput);
    EXPECT_EQ(smp.getWorkerCount(), 0u);
}

TEST_F(SmpPhaseTest, LaunchRejectsNullCallback) {
    duo::SmpPhase smp = duo::BringupPhase(gate).enterSmp();

    duo::Status status = smp.launch({ .workers = 1 }, nullptr, nullptr);
    EXPECT_EQ(status, duo::StatusInvalidInput);
}

TEST_F(SmpPhaseTest, CallbackWithUserData) {
    duo::SmpPhase smp = duo::BringupPhase(gate).enterSmp();
    std::atomic<unsigned> sum = 0;

    duo::SmpWorkerCallback callback = [](unsigned index, void *user) {
        static_cast<std::atomic<unsigned>*>(user)->fetch_add(index + 1);
    };

    ASSERT_EQ(smp.launch({ .workers = 3 }, callback, &sum), duo::StatusSuccess);
    smp.join();

    EXPECT_EQ(sum.load(), 1u + 2u + 3u);
}

TEST_F(SmpPhaseTest, WorkersObserveRawAtomics) {
    duo::SpinMutex<std::set<unsigned>> seen { gate };

    {
        //
        // Still single threaded, the guard must not touch the lock state.
        //
        auto guard = seen.lock();
        EXPECT_FALSE(guard.isAtomic());
    }

    duo::SmpPhase smp = duo::BringupPhase(gate).enterSmp();
    std::atomic<bool> allAtomic = true;

    ASSERT_EQ(smp.launch({ .workers = 3 }, [&](unsigned index) {
        auto guard = seen.lock();
        if (!guard.isAtomic()) allAtomic = false;
        guard->insert(index);
    }), duo::StatusSuccess);

    smp.join();

    EXPECT_TRUE(allAtomic);
    EXPECT_EQ(seen.lock()->size(), 3u);
    EXPECT_FALSE(LockInspector::isLocked(seen));
}

TEST_F(SmpPhaseTest, DestructorJoins) {
    std::atomic<unsigned> done = 0;

    {
        duo::SmpPhase smp = duo::BringupPhase(gate).enterSmp();
        ASSERT_EQ(smp.launch({ .workers = 2 }, [&](unsigned) { done += 1; }), duo::StatusSuccess);
    }

    EXPECT_EQ(done.load(), 2u);
}

TEST_F(SmpPhaseTest, MovePhase) {
    duo::SmpPhase smp = duo::BringupPhase(gate).enterSmp();
    std::atomic<unsigned> done = 0;
    ASSERT_EQ(smp.launch({ .workers = 2 }, [&](unsigned) { done += 1; }), duo::StatusSuccess);

    duo::SmpPhase moved = std::move(smp);
    EXPECT_EQ(moved.join(), 2u);
    EXPECT_EQ(done.load(), 2u);
}

TEST_F(SmpPhaseTest, JoinReleasesCallables) {
    duo::SmpPhase smp = duo::BringupPhase(gate).enterSmp();
    std::shared_ptr<int> token = std::make_shared<int>(0);

    for (int i = 0; i < 100; i++) {
        ASSERT_EQ(smp.launch({ .workers = 1 }, [token](unsigned) { }), duo::StatusSuccess);
        EXPECT_EQ(smp.join(), 1u);
    }

    EXPECT_EQ(token.use_count(), 1);
}

TEST_F(SmpPhaseTest, RejectedLaunchReleasesCallable) {
    duo::SmpPhase smp = duo::BringupPhase(gate).enterSmp();
    std::shared_ptr<int> token = std::make_shared<int>(0);

    EXPECT_EQ(smp.launch({ .workers = 0 }, [token](unsigned) { }), duo::StatusInvalidInput);
    EXPECT_EQ(token.use_count(), 1);
}
