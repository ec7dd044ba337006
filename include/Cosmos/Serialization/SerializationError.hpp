#pragma once

#include <cstdint>
#include <string_view>

namespace Cosmos
{
    /**
    * Error codes for serialization operations
    */
    enum class SerializationError
    {
        None,
        InvalidMagic,
        UnsupportedVersion,
        UnexpectedRecordKind,
        CorruptedData,
        SizeMismatch,
        EndiannessMismatch,
        ChecksumMismatch
    };

    constexpr std::string_view ToString(SerializationError error) noexcept
    {
        switch (error)
        {
            case SerializationError::None: return "None";
            case SerializationError::InvalidMagic: return "InvalidMagic";
            case SerializationError::UnsupportedVersion: return "UnsupportedVersion";
            case SerializationError::UnexpectedRecordKind: return "UnexpectedRecordKind";
            case SerializationError::CorruptedData: return "CorruptedData";
            case SerializationError::SizeMismatch: return "SizeMismatch";
            case SerializationError::EndiannessMismatch: return "EndiannessMismatch";
            case SerializationError::ChecksumMismatch: return "ChecksumMismatch";
        }
        return "Unknown";
    }
}
