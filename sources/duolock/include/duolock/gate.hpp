#pragma once

#include "duolock/fwd.hpp"

namespace duo {
    /// @brief A boolean with no synchronization whatsoever.
    ///
    /// Every access is a plain load or store. A reader is only guaranteed to observe the
    /// last store if a happens-before edge between the two was established by some other
    /// means, such as the store preceding the creation of the reading thread.
    /// Concurrent access with at least one store is a data race.
    class UncheckedFlag {
        bool mValue;

    public:
        constexpr UncheckedFlag(bool value = false) noexcept
            : mValue(value)
        { }

        /// @pre The last call to @a storeUnchecked happens-before this load.
        bool loadUnchecked() const noexcept {
            return mValue;
        }

        /// @pre No other thread is accessing this flag.
        void storeUnchecked(bool value) noexcept {
            mValue = value;
        }
    };

    /// @brief Records whether raw atomic instructions are safe to execute.
    ///
    /// The gate starts in bring-up mode where only a single execution context exists and
    /// atomic read-modify-write instructions may trap. Once the platform is ready it is
    /// switched into raw-atomic mode, once, through @a BringupPhase::enterSmp.
    ///
    /// @warning The gate must only be switched while no other execution context exists
    ///          and while no lock bound to it is held.
    class AtomicGate {
        UncheckedFlag mRawAtomics;

        friend class BringupPhase;
        friend struct testing::LockInspector;

        void enable() noexcept {
            mRawAtomics.storeUnchecked(true);
        }

        void disable() noexcept {
            mRawAtomics.storeUnchecked(false);
        }

    public:
        constexpr AtomicGate() noexcept = default;

        AtomicGate(const AtomicGate&) = delete;
        AtomicGate& operator=(const AtomicGate&) = delete;

        /// @brief Are raw atomics enabled.
        bool read() const noexcept {
            return mRawAtomics.loadUnchecked();
        }
    };

    namespace detail {
        extern constinit AtomicGate gGlobalGate;
    }

    /// @brief The gate shared by all process wide lock instances.
    constexpr AtomicGate& GlobalGate() noexcept {
        return detail::gGlobalGate;
    }
}
