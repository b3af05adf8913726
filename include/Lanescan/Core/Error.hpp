#pragma once

#include <cstdint>

namespace Lanescan
{
    enum class ErrorCode : std::uint32_t
    {
        None = 0,

        InvalidArgument,

        // Build failures
        EmptyInput,
        CapacityExceeded,
        Unsolvable
    };

    struct Error
    {
        ErrorCode code;
        const char* message;

        constexpr Error(ErrorCode c = ErrorCode::None, const char* msg = nullptr) noexcept
            : code(c), message(msg ? msg : GetDefaultMessage(c))
        {}

        [[nodiscard]] constexpr bool operator==(const Error& other) const noexcept
        {
            return code == other.code;
        }

        [[nodiscard]] constexpr bool operator!=(const Error& other) const noexcept
        {
            return code != other.code;
        }

        [[nodiscard]] static constexpr const char* GetDefaultMessage(ErrorCode code) noexcept
        {
            switch (code)
            {
                case ErrorCode::None: return "No error";
                case ErrorCode::InvalidArgument: return "Invalid argument";
                case ErrorCode::EmptyInput: return "Empty map not supported";
                case ErrorCode::CapacityExceeded: return "Too many keys to perform even a single scan";
                case ErrorCode::Unsolvable: return "Unable to 'solve' with a sufficiently small number of scans";
                default: return "Unspecified error";
            }
        }
    };

    inline constexpr Error MakeError(ErrorCode code, const char* message = nullptr) noexcept
    {
        return Error(code, message);
    }
}
