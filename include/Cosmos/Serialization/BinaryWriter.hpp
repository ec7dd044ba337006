#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "BinaryArchive.hpp"

namespace Cosmos
{
    /**
     * Binary writer for persisting records into a memory buffer.
     * Appends to the output vector; the header checksum covers everything
     * written after WriteHeader().
     */
    class BinaryWriter : public BinaryArchive
    {
    public:
        explicit BinaryWriter(std::vector<std::byte>& output, std::size_t reserveSize = 256)
            : m_output(&output)
        {
            m_output->reserve(m_output->size() + reserveSize);
        }

        COSMOS_NODISCARD bool IsLoading() const noexcept override { return false; }

        /**
         * Write raw bytes
         */
        void WriteBytes(const void* data, std::size_t size)
        {
            if (HasError() || size == 0) return;

            if (m_headerWritten)
            {
                m_runningChecksum = Checksum::Compute(data, size, m_runningChecksum);
                m_payloadBytes += size;
            }

            const std::byte* bytes = static_cast<const std::byte*>(data);
            m_output->insert(m_output->end(), bytes, bytes + size);
        }

        /**
         * Write the record header; FinalizeHeader() patches size and checksum in later
         */
        void WriteHeader(const RecordHeader& header)
        {
            m_headerPosition = m_output->size();
            m_header = header;
            m_headerWritten = false;
            WriteBytes(&m_header, sizeof(RecordHeader));
            m_headerWritten = true;
            m_runningChecksum = 0;
            m_payloadBytes = 0;
        }

        /**
         * Store the payload size and checksum into the header written earlier
         */
        void FinalizeHeader()
        {
            if (HasError() || !m_headerWritten) return;

            m_header.payloadSize = static_cast<std::uint32_t>(m_payloadBytes);
            m_header.checksum = m_runningChecksum;
            std::memcpy(m_output->data() + m_headerPosition, &m_header, sizeof(RecordHeader));
        }

        template<typename T>
        requires RawSerializable<T, BinaryWriter>
        BinaryWriter& operator()(const T& value)
        {
            WriteBytes(&value, sizeof(T));
            return *this;
        }

        BinaryWriter& operator()(const bool& value)
        {
            const std::uint8_t raw = value ? 1 : 0;
            WriteBytes(&raw, sizeof(raw));
            return *this;
        }

        template<typename T>
        requires HasSerializeMethod<T, BinaryWriter>
        BinaryWriter& operator()(const T& value)
        {
            value.Serialize(*this);
            return *this;
        }

        BinaryWriter& operator()(const std::string& str)
        {
            WriteLength(str.size());
            WriteBytes(str.data(), str.size());
            return *this;
        }

        template<typename T>
        BinaryWriter& operator()(const std::vector<T>& vec)
        {
            WriteLength(vec.size());

            if constexpr (RawSerializable<T, BinaryWriter>)
            {
                WriteBytes(vec.data(), vec.size() * sizeof(T));
            }
            else
            {
                for (const auto& item : vec)
                {
                    (*this)(item);
                }
            }
            return *this;
        }

        template<typename T1, typename T2>
        BinaryWriter& operator()(const std::pair<T1, T2>& p)
        {
            (*this)(p.first)(p.second);
            return *this;
        }

        template<typename T>
        BinaryWriter& operator()(const std::optional<T>& opt)
        {
            const bool hasValue = opt.has_value();
            (*this)(hasValue);
            if (hasValue)
            {
                (*this)(*opt);
            }
            return *this;
        }

        template<typename K, typename V, typename Compare, typename Allocator>
        BinaryWriter& operator()(const std::map<K, V, Compare, Allocator>& map)
        {
            WriteLength(map.size());
            for (const auto& [key, value] : map)
            {
                (*this)(key)(value);
            }
            return *this;
        }

        COSMOS_NODISCARD std::size_t GetBytesWritten() const noexcept { return m_output->size(); }
        COSMOS_NODISCARD std::uint32_t GetChecksum() const noexcept { return m_runningChecksum; }

    private:
        void WriteLength(std::size_t length)
        {
            const std::uint64_t value = static_cast<std::uint64_t>(length);
            WriteBytes(&value, sizeof(value));
        }

        std::vector<std::byte>* m_output;
        RecordHeader m_header;
        std::size_t m_headerPosition = 0;
        bool m_headerWritten = false;
        std::uint32_t m_runningChecksum = 0;
        std::size_t m_payloadBytes = 0;
    };
}
