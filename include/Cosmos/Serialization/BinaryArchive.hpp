#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include "../Core/Base.hpp"
#include "../Core/Hash.hpp"
#include "SerializationError.hpp"

namespace Cosmos
{
    /**
     * Payload checksum utilities
     */
    namespace Checksum
    {
        /**
         * Rolling checksum over a buffer, 8 bytes per step.
         * Uses hardware CRC32 instructions when available.
         */
        inline std::uint32_t Compute(const void* data, std::size_t size, std::uint32_t seed = 0)
        {
            const std::uint8_t* bytes = static_cast<const std::uint8_t*>(data);
            std::uint64_t result = seed;

            while (size >= 8)
            {
                std::uint64_t value;
                std::memcpy(&value, bytes, sizeof(std::uint64_t));
                result = HashCombine(result, value);
                bytes += 8;
                size -= 8;
            }

            if (size > 0)
            {
                std::uint64_t value = 0;
                std::memcpy(&value, bytes, size);
                result = HashCombine(result, value);
            }

            return static_cast<std::uint32_t>(result);
        }
    }

    /**
     * Record format version history:
     * v1: header + payload, payload checksum, one record per store key
     */
    inline constexpr std::uint16_t RECORD_FORMAT_VERSION = 1;
    inline constexpr char RECORD_MAGIC[6] = "COSMO";

    /**
     * Kind of aggregate a record holds. Stored in the header so a record read
     * back under the wrong key is rejected instead of misparsed.
     */
    enum class RecordKind : std::uint8_t
    {
        Unknown = 0,
        Flag = 1,
        World = 2,
        Register = 3
    };

    /**
     * Header placed in front of every persisted record
     */
    COSMOS_PACK_BEGIN
    struct RecordHeader
    {
        char magic[5];               // "COSMO" - 5 bytes
        std::uint16_t version;       // Format version - 2 bytes
        std::uint8_t endianness;     // 0 = little, 1 = big - 1 byte
        std::uint8_t kind;           // RecordKind - 1 byte
        std::uint32_t payloadSize;   // Bytes after the header - 4 bytes
        std::uint32_t checksum;      // Checksum of the payload - 4 bytes
        std::uint8_t reserved[15];   // Reserved - 15 bytes

        RecordHeader() noexcept
        {
            std::memcpy(magic, RECORD_MAGIC, 5);
            version = RECORD_FORMAT_VERSION;
            endianness = IsLittleEndian() ? 0 : 1;
            kind = static_cast<std::uint8_t>(RecordKind::Unknown);
            payloadSize = 0;
            checksum = 0;
            std::memset(reserved, 0, sizeof(reserved));
        }

        explicit RecordHeader(RecordKind recordKind) noexcept : RecordHeader()
        {
            kind = static_cast<std::uint8_t>(recordKind);
        }

        COSMOS_NODISCARD bool IsValid() const noexcept
        {
            return std::memcmp(magic, RECORD_MAGIC, 5) == 0;
        }

        COSMOS_NODISCARD bool IsVersionSupported() const noexcept
        {
            return version <= RECORD_FORMAT_VERSION;
        }

        COSMOS_NODISCARD bool IsEndianCompatible() const noexcept
        {
            return endianness == (IsLittleEndian() ? 0 : 1);
        }

        COSMOS_NODISCARD RecordKind GetKind() const noexcept
        {
            return static_cast<RecordKind>(kind);
        }

    private:
        COSMOS_NODISCARD static constexpr bool IsLittleEndian() noexcept
        {
#if defined(COSMOS_LITTLE_ENDIAN)
            return true;
#else
            return false;
#endif
        }
    };
    COSMOS_PACK_END

    static_assert(sizeof(RecordHeader) == 32, "RecordHeader must be exactly 32 bytes");

    class BinaryWriter;
    class BinaryReader;

    /**
     * A type persists itself through `void Serialize(Writer&) const`
     */
    template<typename T, typename Writer>
    concept HasSerializeMethod = requires(const T& value, Writer& writer)
    {
        { value.Serialize(writer) } -> std::same_as<void>;
    };

    /**
     * A type restores itself through `void Deserialize(Reader&)`
     */
    template<typename T, typename Reader>
    concept HasDeserializeMethod = requires(T& value, Reader& reader)
    {
        { value.Deserialize(reader) } -> std::same_as<void>;
    };

    /**
     * Types written as their raw object representation
     */
    template<typename T, typename Archive>
    concept RawSerializable = std::is_trivially_copyable_v<T>
        && !HasSerializeMethod<T, Archive>
        && !HasDeserializeMethod<T, Archive>;

    /**
     * Base class for binary archive operations
     */
    class BinaryArchive
    {
    public:
        BinaryArchive() = default;
        virtual ~BinaryArchive() = default;

        BinaryArchive(const BinaryArchive&) = delete;
        BinaryArchive& operator=(const BinaryArchive&) = delete;

        COSMOS_NODISCARD virtual bool IsLoading() const noexcept = 0;
        COSMOS_NODISCARD bool IsSaving() const noexcept { return !IsLoading(); }

        COSMOS_NODISCARD bool HasError() const noexcept { return m_error != SerializationError::None; }
        COSMOS_NODISCARD SerializationError GetError() const noexcept { return m_error; }

    protected:
        SerializationError m_error = SerializationError::None;
    };
}
