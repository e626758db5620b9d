#pragma once

#define DUO_NOCOPY(it) \
    it(const it&) = delete; \
    it& operator=(const it&) = delete;

#define DUO_NOMOVE(it) \
    it(it&&) = delete; \
    it& operator=(it&&) = delete;

namespace duo {
    /// @brief Empty payload for a mutex used purely as an exclusion token.
    struct Token { };
}
