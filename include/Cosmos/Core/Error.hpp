#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

#include <fmt/format.h>

#include "Base.hpp"

namespace Cosmos
{
    enum class ErrorCode : std::uint32_t
    {
        None = 0,

        // Preconditions
        WorldNotCreated,
        RegistryMissing,

        // Capacity
        CapacityExceeded,

        // Persistence
        StorageError,
        CorruptedRecord,

        InvalidArgument,

        Unknown = 0xFFFFFFFF
    };

    struct Error
    {
        ErrorCode code;
        const char* message;

        constexpr Error(ErrorCode c = ErrorCode::None, const char* msg = nullptr) noexcept
            : code(c), message(msg ? msg : GetDefaultMessage(c))
        {}

        COSMOS_NODISCARD constexpr bool operator==(const Error& other) const noexcept
        {
            return code == other.code;
        }

        COSMOS_NODISCARD constexpr bool IsPrecondition() const noexcept
        {
            return code == ErrorCode::WorldNotCreated || code == ErrorCode::RegistryMissing;
        }

        COSMOS_NODISCARD static constexpr const char* GetDefaultMessage(ErrorCode code) noexcept
        {
            switch (code)
            {
                case ErrorCode::None: return "No error";
                case ErrorCode::WorldNotCreated: return "World has not been created by genesis";
                case ErrorCode::RegistryMissing: return "No component register exists yet";
                case ErrorCode::CapacityExceeded: return "Component bitmap capacity exceeded";
                case ErrorCode::StorageError: return "Store access failed";
                case ErrorCode::CorruptedRecord: return "Persisted record is corrupted";
                case ErrorCode::InvalidArgument: return "Invalid argument";
                case ErrorCode::Unknown: return "Unknown error";
                default: return "Unspecified error";
            }
        }
    };

    inline constexpr Error MakeError(ErrorCode code, const char* message = nullptr) noexcept
    {
        return Error(code, message);
    }

    COSMOS_NODISCARD constexpr std::string_view ToString(ErrorCode code) noexcept
    {
        switch (code)
        {
            case ErrorCode::None: return "None";
            case ErrorCode::WorldNotCreated: return "WorldNotCreated";
            case ErrorCode::RegistryMissing: return "RegistryMissing";
            case ErrorCode::CapacityExceeded: return "CapacityExceeded";
            case ErrorCode::StorageError: return "StorageError";
            case ErrorCode::CorruptedRecord: return "CorruptedRecord";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::Unknown: return "Unknown";
        }
        return "Unspecified";
    }
}

namespace std
{
    template<>
    struct hash<Cosmos::Error>
    {
        std::size_t operator()(const Cosmos::Error& e) const noexcept
        {
            return std::hash<std::uint32_t>{}(static_cast<std::uint32_t>(e.code));
        }
    };
}

template<>
struct fmt::formatter<Cosmos::Error> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(const Cosmos::Error& error, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{} ({})", Cosmos::ToString(error.code), error.message);
    }
};
