#include "duolock/phase.hpp"

#include "duolock/categories.hpp"
#include "duolock/panic.hpp"

#include <system_error>

duo::SmpPhase duo::BringupPhase::enterSmp() && {
    DUO_CHECK(mGate != nullptr, "Bring-up phase was already consumed");
    DUO_CHECK(!mGate->read(), "Raw atomics were already enabled");

    AtomicGate *gate = std::exchange(mGate, nullptr);
    gate->enable();

    SmpLog.infof("Raw atomics ", enabled(true), ", leaving bring-up.");

    return SmpPhase(*gate);
}

duo::SmpPhase::~SmpPhase() noexcept {
    join();
}

duo::Status duo::SmpPhase::launch(SmpLaunchOptions options, SmpWorkerCallback callback, void *user) noexcept {
    if (options.workers == 0 || callback == nullptr) {
        SmpLog.warnf("Invalid launch request for ", options.workers, " workers.");
        return StatusInvalidInput;
    }

    try {
        mWorkers.reserve(mWorkers.size() + options.workers);
    } catch (const std::bad_alloc&) {
        SmpLog.errorf("Failed to reserve space for ", options.workers, " workers.");
        return StatusOutOfMemory;
    }

    for (unsigned i = 0; i < options.workers; i++) {
        try {
            mWorkers.emplace_back([callback, user, i] {
                callback(i, user);
            });
        } catch (const std::system_error& error) {
            SmpLog.errorf("Failed to start worker ", i, " of ", options.workers, ": ", std::string_view(error.what()));
            return StatusOutOfMemory;
        }
    }

    SmpLog.dbgf("Launched ", options.workers, " workers, ", mWorkers.size(), " running.");
    return StatusSuccess;
}

size_t duo::SmpPhase::join() noexcept {
    size_t count = 0;
    for (std::jthread& worker : mWorkers) {
        if (worker.joinable()) {
            worker.join();
            count += 1;
        }
    }

    mWorkers.clear();
    mUserData.clear();

    if (count > 0) {
        SmpLog.dbgf("Joined ", count, " workers.");
    }

    return count;
}
