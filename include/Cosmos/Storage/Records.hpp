#pragma once

#include <optional>
#include <span>
#include <string_view>

#include "../Core/Log.hpp"
#include "../Registry/ComponentRegister.hpp"
#include "../Serialization/BinaryReader.hpp"
#include "../Serialization/BinaryWriter.hpp"
#include "../World/World.hpp"
#include "Store.hpp"

namespace Cosmos
{
    /**
     * Per-aggregate record metadata. Specialize for every type persisted under a store key.
     */
    template<typename T>
    struct RecordTraits;

    template<>
    struct RecordTraits<bool>
    {
        static constexpr RecordKind Kind = RecordKind::Flag;
        static bool IsConsistent(bool) noexcept { return true; }
    };

    template<>
    struct RecordTraits<World>
    {
        static constexpr RecordKind Kind = RecordKind::World;
        static bool IsConsistent(const World& world) { return world.IsConsistent(); }
    };

    template<>
    struct RecordTraits<ComponentRegister>
    {
        static constexpr RecordKind Kind = RecordKind::Register;
        static bool IsConsistent(const ComponentRegister& reg) { return reg.IsConsistent(); }
    };

    template<typename T>
    concept Record = requires { RecordTraits<T>::Kind; };

    template<Record T>
    COSMOS_NODISCARD Bytes EncodeRecord(const T& value)
    {
        Bytes out;
        BinaryWriter writer(out);
        writer.WriteHeader(RecordHeader(RecordTraits<T>::Kind));
        writer(value);
        writer.FinalizeHeader();
        return out;
    }

    /**
     * Decode a record, validating header, payload size, checksum and the
     * aggregate's own invariants. Any failure is reported as CorruptedRecord.
     */
    template<Record T>
    COSMOS_NODISCARD Result<T, Error> DecodeRecord(std::span<const std::byte> data, bool verifyChecksum = true)
    {
        BinaryReader reader(data);

        auto header = reader.ReadHeader(RecordTraits<T>::Kind);
        if (header.IsErr())
        {
            COSMOS_LOG_ERROR("rejected record header: {}", ToString(header.Error()));
            return Err(MakeError(ErrorCode::CorruptedRecord));
        }

        T value{};
        reader(value);

        if (verifyChecksum)
        {
            auto verified = reader.VerifyChecksum();
            if (verified.IsErr())
            {
                COSMOS_LOG_ERROR("rejected record payload: {}", ToString(verified.Error()));
                return Err(MakeError(ErrorCode::CorruptedRecord));
            }
        }
        else if (reader.HasError() || reader.Remaining() != 0)
        {
            COSMOS_LOG_ERROR("rejected record payload: {}", ToString(reader.HasError() ? reader.GetError() : SerializationError::SizeMismatch));
            return Err(MakeError(ErrorCode::CorruptedRecord));
        }

        if (!RecordTraits<T>::IsConsistent(value))
        {
            COSMOS_LOG_ERROR("rejected record: aggregate invariants do not hold");
            return Err(MakeError(ErrorCode::CorruptedRecord, "Persisted aggregate violates its invariants"));
        }

        return value;
    }

    template<Record T>
    COSMOS_NODISCARD Result<std::optional<T>, Error> LoadRecord(const Store& store, std::string_view key, bool verifyChecksum = true)
    {
        auto blob = store.Get(key);
        if (blob.IsErr())
        {
            return Err(blob.Error());
        }

        if (!blob.Value().has_value())
        {
            return std::optional<T>{};
        }

        auto decoded = DecodeRecord<T>(*blob.Value(), verifyChecksum);
        if (decoded.IsErr())
        {
            COSMOS_LOG_ERROR("record under key '{}' is unreadable", key);
            return Err(decoded.Error());
        }

        return std::optional<T>(std::move(decoded).Value());
    }

    template<Record T>
    COSMOS_NODISCARD Result<void, Error> SaveRecord(Store& store, std::string_view key, const T& value)
    {
        const Bytes encoded = EncodeRecord(value);
        return store.Set(key, encoded);
    }
}
