#pragma once

#include "duolock/gate.hpp"
#include "duolock/spinlock.hpp"
#include "duolock/util.hpp"

#include <optional>
#include <string_view>
#include <utility>

namespace duo {
    /// @brief Proof that the caller already has exclusive access to a mutex's value.
    ///
    /// Constructed from a string literal stating why access is exclusive, such as
    /// "only the boot processor is running" or "caller holds the table lock".
    class ExclusiveAccess {
        std::string_view mReason;

    public:
        explicit consteval ExclusiveAccess(const char *reason)
            : mReason(reason)
        {
            if (mReason.empty()) {
                throw "ExclusiveAccess requires a reason";
            }
        }

        constexpr std::string_view reason() const noexcept {
            return mReason;
        }
    };

    /// @brief Scoped access to the value owned by a @a SpinMutex.
    ///
    /// Whether the destructor releases the lock is decided when the guard is created
    /// and never re-read from the gate.
    template<typename T>
    class [[nodiscard]] MutexGuard {
        SpinMutex<T> *mMutex;
        bool mUnlockOnRelease;

        friend class SpinMutex<T>;

        constexpr MutexGuard(SpinMutex<T> *mutex, bool unlockOnRelease) noexcept
            : mMutex(mutex)
            , mUnlockOnRelease(unlockOnRelease)
        { }

    public:
        DUO_NOCOPY(MutexGuard);

        MutexGuard(MutexGuard&& other) noexcept
            : mMutex(std::exchange(other.mMutex, nullptr))
            , mUnlockOnRelease(std::exchange(other.mUnlockOnRelease, false))
        { }

        MutexGuard& operator=(MutexGuard&&) = delete;

        ~MutexGuard() noexcept DUO_NO_THREAD_SAFETY_ANALYSIS {
            if (mUnlockOnRelease) {
                mMutex->mLock.unlock();
            }
        }

        /// @brief Does this guard release the lock state when it is destroyed.
        bool isAtomic() const noexcept { return mUnlockOnRelease; }

        T& get() noexcept { return mMutex->mValue; }
        const T& get() const noexcept { return mMutex->mValue; }

        T& operator*() noexcept { return get(); }
        const T& operator*() const noexcept { return get(); }

        T *operator->() noexcept { return &get(); }
        const T *operator->() const noexcept { return &get(); }
    };

    /// @brief Spin mutex that elides all atomic operations during bring-up.
    ///
    /// While the bound gate is in bring-up mode the lock state is never read or written
    /// and every acquisition succeeds immediately, the caller guarantees there is only
    /// one execution context. In raw-atomic mode this is a regular spin lock.
    ///
    /// @tparam T The protected value.
    template<typename T>
    class SpinMutex {
        const AtomicGate *mGate;
        SpinLock mLock;
        T mValue;

        friend class MutexGuard<T>;
        friend struct testing::LockInspector;

    public:
        using Guard = MutexGuard<T>;

        constexpr SpinMutex(const AtomicGate& gate, T value = T{})
            : mGate(&gate)
            , mValue(std::move(value))
        { }

        DUO_NOCOPY(SpinMutex);
        DUO_NOMOVE(SpinMutex);

        /// @brief Acquire the mutex, spinning until it is available.
        ///
        /// The gate is read once. In bring-up mode nothing is acquired and the returned
        /// guard releases nothing.
        [[nodiscard]]
        Guard lock() noexcept DUO_NO_THREAD_SAFETY_ANALYSIS {
            bool atomic = mGate->read();
            if (atomic) {
                mLock.lock();
            }

            return Guard(this, atomic);
        }

        /// @brief Attempt to acquire the mutex without spinning.
        ///
        /// Always succeeds in bring-up mode.
        [[nodiscard]]
        std::optional<Guard> tryLock() noexcept DUO_NO_THREAD_SAFETY_ANALYSIS {
            bool atomic = mGate->read();
            if (atomic && !mLock.try_lock()) {
                return std::nullopt;
            }

            return Guard(this, atomic);
        }

        /// @brief Access the value without acquiring or releasing the lock.
        ///
        /// @warning No other guard for this mutex may exist while the returned guard is
        ///          alive and no other thread may access the value. Violating this is a
        ///          data race on the protected value.
        ///
        /// @param proof Why the caller already has exclusive access.
        [[nodiscard]]
        Guard noLock([[maybe_unused]] ExclusiveAccess proof) noexcept {
#if DUO_LOCK_CHECKS
            DUO_CHECK(!mGate->read() || !mLock.isLocked(), "SpinMutex::noLock called while the mutex is held");
#endif
            return Guard(this, false);
        }

        const AtomicGate& gate() const noexcept {
            return *mGate;
        }
    };
}
