#pragma once

#include <stdint.h>

namespace duo {
    typedef uint32_t Status;

    enum StatusId : Status {
        /// @brief The operation was successful.
        StatusSuccess = 0x0000,

        /// @brief The operation could not be completed due to a lack of memory or threads.
        StatusOutOfMemory = 0x0001,

        /// @brief The requested resource could not be found.
        StatusNotFound = 0x0002,

        /// @brief The input to the operation was invalid.
        StatusInvalidInput = 0x0003,

        /// @brief The resource already exists.
        StatusAlreadyExists = 0x0004,
    };
}
