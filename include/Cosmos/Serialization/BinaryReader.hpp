#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "../Core/Result.hpp"
#include "BinaryArchive.hpp"

namespace Cosmos
{
    /**
     * Binary reader for records held in memory, with header and checksum validation.
     * The first failure latches; every later read is a no-op and the error is
     * reported through GetError().
     */
    class BinaryReader : public BinaryArchive
    {
    public:
        explicit BinaryReader(std::span<const std::byte> data)
            : m_data(data)
        {
        }

        explicit BinaryReader(const std::vector<std::byte>& data)
            : BinaryReader(std::span<const std::byte>(data))
        {
        }

        COSMOS_NODISCARD bool IsLoading() const noexcept override { return true; }

        void ReadBytes(void* data, std::size_t size)
        {
            if (HasError() || size == 0) return;

            if (size > Remaining())
            {
                m_error = SerializationError::CorruptedData;
                return;
            }

            std::memcpy(data, m_data.data() + m_position, size);

            if (m_headerRead)
            {
                m_runningChecksum = Checksum::Compute(data, size, m_runningChecksum);
            }

            m_position += size;
        }

        /**
         * Read and validate the record header
         */
        Result<RecordHeader, SerializationError> ReadHeader(RecordKind expected)
        {
            RecordHeader header;
            ReadBytes(&header, sizeof(RecordHeader));

            if (HasError())
            {
                return Err(m_error);
            }

            if (!header.IsValid())
            {
                m_error = SerializationError::InvalidMagic;
                return Err(m_error);
            }

            if (!header.IsVersionSupported())
            {
                m_error = SerializationError::UnsupportedVersion;
                return Err(m_error);
            }

            if (!header.IsEndianCompatible())
            {
                m_error = SerializationError::EndiannessMismatch;
                return Err(m_error);
            }

            if (header.GetKind() != expected)
            {
                m_error = SerializationError::UnexpectedRecordKind;
                return Err(m_error);
            }

            if (header.payloadSize != Remaining())
            {
                m_error = SerializationError::SizeMismatch;
                return Err(m_error);
            }

            m_header = header;
            m_headerRead = true;
            m_runningChecksum = 0;
            return header;
        }

        /**
         * Compare the checksum of everything read since the header with the stored one.
         * Call after the payload has been consumed.
         */
        Result<void, SerializationError> VerifyChecksum()
        {
            if (HasError())
            {
                return Err(m_error);
            }

            if (Remaining() != 0)
            {
                m_error = SerializationError::SizeMismatch;
                return Err(m_error);
            }

            if (m_runningChecksum != m_header.checksum)
            {
                m_error = SerializationError::ChecksumMismatch;
                return Err(m_error);
            }

            return {};
        }

        template<typename T>
        requires RawSerializable<T, BinaryReader>
        BinaryReader& operator()(T& value)
        {
            ReadBytes(&value, sizeof(T));
            return *this;
        }

        // Booleans travel as one byte holding 0 or 1; anything else is damage
        BinaryReader& operator()(bool& value)
        {
            std::uint8_t raw = 0;
            ReadBytes(&raw, sizeof(raw));
            if (HasError()) return *this;

            if (raw > 1)
            {
                m_error = SerializationError::CorruptedData;
                return *this;
            }
            value = raw != 0;
            return *this;
        }

        template<typename T>
        requires HasDeserializeMethod<T, BinaryReader>
        BinaryReader& operator()(T& value)
        {
            value.Deserialize(*this);
            return *this;
        }

        BinaryReader& operator()(std::string& str)
        {
            const std::size_t length = ReadLength(1);
            if (HasError()) return *this;

            str.resize(length);
            ReadBytes(str.data(), length);
            return *this;
        }

        template<typename T>
        BinaryReader& operator()(std::vector<T>& vec)
        {
            vec.clear();
            const std::size_t size = ReadLength(RawSerializable<T, BinaryReader> ? sizeof(T) : 1);
            if (HasError()) return *this;

            if constexpr (RawSerializable<T, BinaryReader>)
            {
                vec.resize(size);
                ReadBytes(vec.data(), size * sizeof(T));
            }
            else
            {
                vec.reserve(size);
                for (std::size_t i = 0; i < size && !HasError(); ++i)
                {
                    T item{};
                    (*this)(item);
                    vec.push_back(std::move(item));
                }
            }
            return *this;
        }

        template<typename T1, typename T2>
        BinaryReader& operator()(std::pair<T1, T2>& p)
        {
            (*this)(p.first)(p.second);
            return *this;
        }

        template<typename T>
        BinaryReader& operator()(std::optional<T>& opt)
        {
            bool hasValue = false;
            (*this)(hasValue);
            if (HasError()) return *this;

            if (hasValue)
            {
                T value{};
                (*this)(value);
                opt = std::move(value);
            }
            else
            {
                opt.reset();
            }
            return *this;
        }

        template<typename K, typename V, typename Compare, typename Allocator>
        BinaryReader& operator()(std::map<K, V, Compare, Allocator>& map)
        {
            map.clear();
            const std::size_t size = ReadLength(1);

            for (std::size_t i = 0; i < size && !HasError(); ++i)
            {
                K key{};
                V value{};
                (*this)(key)(value);
                if (HasError()) break;

                if (!map.emplace(std::move(key), std::move(value)).second)
                {
                    // Keys are written from an ordered map, so duplicates mean damage
                    m_error = SerializationError::CorruptedData;
                }
            }
            return *this;
        }

        COSMOS_NODISCARD std::size_t Remaining() const noexcept { return m_data.size() - m_position; }
        COSMOS_NODISCARD std::size_t GetPosition() const noexcept { return m_position; }

    private:
        // Reads a length prefix and rejects values that cannot fit in the remaining bytes
        std::size_t ReadLength(std::size_t minElementSize)
        {
            std::uint64_t length = 0;
            ReadBytes(&length, sizeof(length));
            if (HasError()) return 0;

            if (length > Remaining() / minElementSize)
            {
                m_error = SerializationError::CorruptedData;
                return 0;
            }
            return static_cast<std::size_t>(length);
        }

        std::span<const std::byte> m_data;
        std::size_t m_position = 0;
        RecordHeader m_header;
        bool m_headerRead = false;
        std::uint32_t m_runningChecksum = 0;
    };
}
