#pragma once

#include "duolock/gate.hpp"
#include "duolock/status.hpp"
#include "duolock/util.hpp"

#include <memory>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace duo {
    struct SmpLaunchOptions {
        /// @brief Number of execution contexts to start.
        unsigned workers = 1;
    };

    using SmpWorkerCallback = void(*)(unsigned index, void *user);

    /// @brief Raw-atomic phase of execution.
    ///
    /// Only obtainable by consuming a @a BringupPhase, so the right to switch the gate
    /// is gone by the time any concurrent execution context can be launched.
    ///
    /// @warning Library logging (@a SmpLog, @a BugLog) goes through the global log queue,
    ///          which is bound to @a GlobalGate. When this phase was entered from another
    ///          gate, log messages from concurrent workers are only serialized once
    ///          @a GlobalGate is in raw-atomic mode as well.
    class SmpPhase {
        const AtomicGate *mGate;
        std::vector<std::jthread> mWorkers;
        std::vector<std::shared_ptr<void>> mUserData;

        friend class BringupPhase;

        explicit SmpPhase(const AtomicGate& gate) noexcept
            : mGate(&gate)
        { }

    public:
        DUO_NOCOPY(SmpPhase);

        SmpPhase(SmpPhase&&) noexcept = default;
        SmpPhase& operator=(SmpPhase&&) = delete;

        ~SmpPhase() noexcept;

        /// @brief Start @p options.workers execution contexts.
        ///
        /// Each context calls @p callback with its index and @p user.
        ///
        /// @return StatusInvalidInput if no workers were requested, StatusOutOfMemory if a
        ///         thread could not be created. Workers started before the failure keep running.
        [[nodiscard]]
        Status launch(SmpLaunchOptions options, SmpWorkerCallback callback, void *user) noexcept;

        template<typename F> requires (std::is_invocable_v<F&, unsigned>)
        [[nodiscard]]
        Status launch(SmpLaunchOptions options, F&& body) noexcept {
            using Body = std::decay_t<F>;

            void *user = nullptr;
            try {
                std::shared_ptr<Body> state = std::make_shared<Body>(std::forward<F>(body));
                user = state.get();

                //
                // The callable must outlive every worker, including ones started
                // before a later launch failure.
                //
                mUserData.push_back(std::move(state));
            } catch (const std::bad_alloc&) {
                return StatusOutOfMemory;
            }

            SmpWorkerCallback callback = [](unsigned index, void *user) {
                (*static_cast<Body*>(user))(index);
            };

            size_t running = mWorkers.size();
            Status status = launch(options, callback, user);
            if (status != StatusSuccess && mWorkers.size() == running) {
                mUserData.pop_back();
            }

            return status;
        }

        /// @brief Wait for every launched execution context to finish.
        ///
        /// Releases the callables passed to @a launch once their workers are joined.
        ///
        /// @return The number of contexts joined.
        size_t join() noexcept;

        size_t getWorkerCount() const noexcept { return mWorkers.size(); }

        const AtomicGate& gate() const noexcept { return *mGate; }
    };

    /// @brief Single context bring-up phase, owns the right to enable raw atomics.
    ///
    /// @warning The library loggers stay in bring-up mode until @a GlobalGate itself is
    ///          switched, whichever gate this phase owns.
    class BringupPhase {
        AtomicGate *mGate;

    public:
        constexpr explicit BringupPhase(AtomicGate& gate) noexcept
            : mGate(&gate)
        { }

        DUO_NOCOPY(BringupPhase);

        BringupPhase(BringupPhase&& other) noexcept
            : mGate(std::exchange(other.mGate, nullptr))
        { }

        BringupPhase& operator=(BringupPhase&&) = delete;

        const AtomicGate& gate() const noexcept { return *mGate; }

        /// @brief Switch the gate into raw-atomic mode and give up bring-up access.
        ///
        /// @pre Atomic read-modify-write instructions are safe on this platform.
        /// @pre No other execution context exists and no lock bound to the gate is held.
        [[nodiscard]]
        SmpPhase enterSmp() &&;
    };
}
