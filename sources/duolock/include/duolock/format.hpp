#pragma once

#include "duolock/status.hpp"

#include <algorithm>
#include <array>
#include <concepts>
#include <limits>
#include <string_view>
#include <type_traits>
#include <utility>

#include <stddef.h>

namespace duo {
    /// @brief Fixed capacity string, silently truncates on overflow.
    template<size_t N>
    class StaticString {
        std::array<char, N> mStorage{};
        size_t mSize = 0;

    public:
        constexpr StaticString() noexcept = default;

        constexpr StaticString(std::string_view text) noexcept {
            append(text);
        }

        constexpr void append(std::string_view text) noexcept {
            size_t count = std::min(text.size(), N - mSize);
            std::copy_n(text.data(), count, mStorage.data() + mSize);
            mSize += count;
        }

        constexpr void append(char c) noexcept {
            if (mSize < N) {
                mStorage[mSize++] = c;
            }
        }

        constexpr const char *data() const noexcept { return mStorage.data(); }
        constexpr size_t size() const noexcept { return mSize; }
        constexpr bool isEmpty() const noexcept { return mSize == 0; }
        static constexpr size_t capacity() noexcept { return N; }

        constexpr operator std::string_view() const noexcept {
            return std::string_view(mStorage.data(), mSize);
        }

        constexpr bool operator==(std::string_view other) const noexcept {
            return std::string_view(*this) == other;
        }
    };

    template<typename T>
    struct Format;

    template<typename T>
    concept IsFormat = requires(char *buffer, const T& value) {
        { Format<T>::kStringSize } -> std::convertible_to<size_t>;
        { Format<T>::toString(buffer, value) } -> std::same_as<std::string_view>;
    };

    template<std::integral T>
    struct Hex {
        T value;
        int width = 0;
        char fill = '0';
        bool prefix = true;

        constexpr Hex(T value) noexcept : value(value) { }

        constexpr Hex pad(int width, char fill = '0', bool prefix = true) const noexcept {
            Hex copy = *this;
            copy.width = width;
            copy.fill = fill;
            copy.prefix = prefix;
            return copy;
        }
    };

    /// @brief Write @p input right aligned into @p buffer of @p size characters.
    ///
    /// @return The view of the characters written, always within the buffer.
    template<std::integral T>
    constexpr std::string_view FormatInt(char *buffer, size_t size, T input, unsigned base, int width = 0, char fill = '\0') noexcept {
        static constexpr char kDigits[] = "0123456789ABCDEF";
        using Unsigned = std::make_unsigned_t<T>;

        bool negative = false;
        Unsigned value = static_cast<Unsigned>(input);
        if constexpr (std::is_signed_v<T>) {
            if (input < 0) {
                negative = true;
                value = Unsigned(0) - value;
            }
        }

        char *end = buffer + size;
        char *ptr = end;
        do {
            *--ptr = kDigits[value % base];
            value /= base;
        } while (value != 0 && ptr > buffer);

        if (fill != '\0') {
            int remaining = width - int(end - ptr) - (negative ? 1 : 0);
            while (remaining-- > 0 && ptr > buffer) {
                *--ptr = fill;
            }
        }

        if (negative && ptr > buffer) {
            *--ptr = '-';
        }

        return std::string_view(ptr, end);
    }

    constexpr std::string_view enabled(bool enabled) noexcept {
        return enabled ? "Enabled" : "Disabled";
    }

    constexpr std::string_view present(bool present) noexcept {
        return present ? "Present" : "Not Present";
    }

    template<>
    struct Format<bool> {
        static constexpr size_t kStringSize = 5;
        static constexpr std::string_view toString(char *, bool value) noexcept {
            return value ? "true" : "false";
        }
    };

    template<std::integral T>
    struct Format<T> {
        static constexpr size_t kStringSize = std::numeric_limits<T>::digits10 + 2;
        static constexpr std::string_view toString(char *buffer, T value) noexcept {
            return FormatInt(buffer, kStringSize, value, 10);
        }
    };

    template<std::integral T>
    struct Format<Hex<T>> {
        static constexpr size_t kDigits = sizeof(T) * 2;
        static constexpr size_t kStringSize = kDigits + 2;

        static constexpr std::string_view toString(char *buffer, Hex<T> value) noexcept {
            using Unsigned = std::make_unsigned_t<T>;
            int width = std::min<int>(value.width, kDigits);
            std::string_view digits = FormatInt(buffer + 2, kDigits, static_cast<Unsigned>(value.value), 16, width, value.fill);
            if (!value.prefix) {
                return digits;
            }

            char *front = buffer + (kDigits - digits.size());
            front[0] = '0';
            front[1] = 'x';
            return std::string_view(front, digits.size() + 2);
        }
    };

    template<>
    struct Format<StatusId> {
        static constexpr size_t kStringSize = 32;
        static std::string_view toString(char *buffer, StatusId status) noexcept;
    };

    namespace detail {
        template<size_t N, typename T>
        constexpr void AppendFormatted(StaticString<N>& out, const T& value) noexcept {
            using U = std::remove_cvref_t<T>;

            if constexpr (std::same_as<U, char>) {
                out.append(value);
            } else if constexpr (std::convertible_to<const T&, std::string_view>) {
                out.append(std::string_view(value));
            } else {
                static_assert(IsFormat<U>, "Type does not provide a Format specialization");

                char buffer[Format<U>::kStringSize];
                out.append(Format<U>::toString(buffer, value));
            }
        }
    }

    /// @brief Format all arguments into a single fixed size string.
    template<size_t N, typename... Args>
    constexpr StaticString<N> concat(Args&&... args) noexcept {
        StaticString<N> result;
        (detail::AppendFormatted(result, std::forward<Args>(args)), ...);
        return result;
    }
}
