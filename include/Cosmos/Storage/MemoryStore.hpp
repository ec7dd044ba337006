#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>

#include "Store.hpp"

namespace Cosmos
{
    /**
     * Store kept in process memory. Durable for the lifetime of the object; used by
     * tests, benchmarks and embedders that persist the blobs themselves.
     */
    class MemoryStore final : public Store
    {
    public:
        Result<bool, Error> Has(std::string_view key) const override
        {
            return m_entries.find(key) != m_entries.end();
        }

        Result<std::optional<Bytes>, Error> Get(std::string_view key) const override
        {
            auto it = m_entries.find(key);
            if (it == m_entries.end())
            {
                return std::optional<Bytes>{};
            }
            return std::optional<Bytes>(it->second);
        }

        Result<void, Error> Set(std::string_view key, std::span<const std::byte> value) override
        {
            auto it = m_entries.find(key);
            if (it == m_entries.end())
            {
                it = m_entries.emplace(std::string(key), Bytes{}).first;
            }
            it->second.assign(value.begin(), value.end());
            ++m_writeCount;
            return {};
        }

        Result<void, Error> Erase(std::string_view key) override
        {
            auto it = m_entries.find(key);
            if (it != m_entries.end())
            {
                m_entries.erase(it);
                ++m_writeCount;
            }
            return {};
        }

        COSMOS_NODISCARD std::size_t Size() const noexcept { return m_entries.size(); }

        // Number of mutations (Set, and Erase of a present key), used to check that failed operations write nothing
        COSMOS_NODISCARD std::size_t WriteCount() const noexcept { return m_writeCount; }

        // Direct access to a stored blob, for inspection and fault injection in tests
        Bytes* Raw(std::string_view key)
        {
            auto it = m_entries.find(key);
            return it != m_entries.end() ? &it->second : nullptr;
        }

    private:
        std::map<std::string, Bytes, std::less<>> m_entries;
        std::size_t m_writeCount = 0;
    };
}
