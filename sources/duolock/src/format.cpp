#include "duolock/format.hpp"

std::string_view duo::Format<duo::StatusId>::toString(char *buffer, StatusId status) noexcept {
    switch (status) {
    case StatusSuccess: return "Success";
    case StatusOutOfMemory: return "Out of memory";
    case StatusNotFound: return "Not found";
    case StatusInvalidInput: return "Invalid input";
    case StatusAlreadyExists: return "Already exists";
    default: {
        std::string_view hex = Format<Hex<Status>>::toString(buffer + 8, Hex<Status>(status).pad(4));
        std::copy_n("Status(", 7, buffer);
        char *end = std::copy(hex.begin(), hex.end(), buffer + 7);
        *end++ = ')';
        return std::string_view(buffer, end);
    }
    }
}
