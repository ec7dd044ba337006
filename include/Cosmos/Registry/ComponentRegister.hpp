#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "../Address/Address.hpp"
#include "../Container/Bitmap.hpp"
#include "../Core/Config.hpp"
#include "../Core/Error.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "BitAllocator.hpp"

namespace Cosmos
{
    using BitIndex = std::uint32_t;

    /**
     * @brief Monotonic bit allocator for component addresses.
     *
     * Every newly seen address receives the next bit index of the shared Mask width.
     * The counter is incremented before use, so index 0 is never issued and the
     * lifetime capacity is BITMAP_BITS - 1 addresses. Indices are never recycled:
     * unregistering an address frees the address, not its bit, and registering the
     * same address again allocates a fresh index.
     *
     * The bit-to-address table is an audit trail and keeps entries for addresses
     * that have since been unregistered.
     */
    class ComponentRegister
    {
    public:
        ComponentRegister() = default;

        /**
         * Allocate a bit for address.
         * @return the single-bit mask, an empty optional if address is already
         *         registered, or CapacityExceeded once every index has been issued.
         *         On failure the register is left unchanged.
         */
        Result<std::optional<Mask>, Error> Register(const Address& address)
        {
            COSMOS_PROFILE_FUNCTION();

            if (Contains(address))
            {
                return std::optional<Mask>{};
            }

            const BitIndex next = m_nextBit + 1;
            if (next >= config::BITMAP_BITS)
            {
                return Err(MakeError(ErrorCode::CapacityExceeded));
            }

            m_nextBit = next;
            m_addresses.push_back(address);
            m_bitToAddress[next] = address;

            return std::optional<Mask>(Mask::FromBit(next));
        }

        /**
         * Remove address from the registered set, keeping the order of the rest.
         * @return false when the address was not registered
         */
        bool Unregister(const Address& address)
        {
            COSMOS_PROFILE_FUNCTION();

            auto it = Find(address);
            if (it == m_addresses.end())
            {
                return false;
            }

            m_addresses.erase(it);
            return true;
        }

        COSMOS_NODISCARD bool Contains(const Address& address) const
        {
            return std::find(m_addresses.begin(), m_addresses.end(), address) != m_addresses.end();
        }

        // Address recorded for a bit index, including addresses that were later unregistered
        COSMOS_NODISCARD const Address* AddressOf(BitIndex index) const
        {
            auto it = m_bitToAddress.find(index);
            return it != m_bitToAddress.end() ? &it->second : nullptr;
        }

        // Bit index currently owned by a registered address
        COSMOS_NODISCARD std::optional<BitIndex> BitIndexOf(const Address& address) const
        {
            if (!Contains(address))
            {
                return std::nullopt;
            }

            for (auto it = m_bitToAddress.rbegin(); it != m_bitToAddress.rend(); ++it)
            {
                if (it->second == address)
                {
                    return it->first;
                }
            }
            return std::nullopt;
        }

        COSMOS_NODISCARD BitIndex NextBit() const noexcept { return m_nextBit; }
        COSMOS_NODISCARD const std::vector<Address>& Addresses() const noexcept { return m_addresses; }
        COSMOS_NODISCARD const std::map<BitIndex, Address>& BitToAddress() const noexcept { return m_bitToAddress; }
        COSMOS_NODISCARD std::size_t Size() const noexcept { return m_addresses.size(); }
        COSMOS_NODISCARD bool Empty() const noexcept { return m_addresses.empty(); }

        COSMOS_NODISCARD static constexpr std::size_t Capacity() noexcept { return config::COMPONENT_CAPACITY; }

        COSMOS_NODISCARD std::size_t Remaining() const noexcept
        {
            return Capacity() - (m_nextBit + 1 - config::FIRST_BIT_INDEX);
        }

        COSMOS_NODISCARD bool IsFull() const noexcept { return Remaining() == 0; }

        /**
         * Structural checks applied to registers loaded from storage
         */
        COSMOS_NODISCARD bool IsConsistent() const
        {
            if (m_nextBit >= config::BITMAP_BITS || m_addresses.size() > m_bitToAddress.size())
            {
                return false;
            }

            if (!m_bitToAddress.empty())
            {
                if (m_bitToAddress.begin()->first < config::FIRST_BIT_INDEX || m_bitToAddress.rbegin()->first != m_nextBit)
                {
                    return false;
                }
            }
            else if (m_nextBit != 0)
            {
                return false;
            }

            // Register() never admits an address twice
            std::vector<Address> sorted(m_addresses);
            std::sort(sorted.begin(), sorted.end());
            if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end())
            {
                return false;
            }

            return std::all_of(m_addresses.begin(), m_addresses.end(), [this](const Address& address)
            {
                return BitIndexOf(address).has_value();
            });
        }

        COSMOS_NODISCARD bool operator==(const ComponentRegister& other) const = default;

        template<typename Writer>
        void Serialize(Writer& writer) const
        {
            writer(m_nextBit)(m_addresses)(m_bitToAddress);
        }

        template<typename Reader>
        void Deserialize(Reader& reader)
        {
            reader(m_nextBit)(m_addresses)(m_bitToAddress);
        }

    private:
        std::vector<Address>::iterator Find(const Address& address)
        {
            if constexpr (config::UNREGISTER_ASSUMES_SORTED)
            {
                auto it = std::lower_bound(m_addresses.begin(), m_addresses.end(), address);
                return (it != m_addresses.end() && *it == address) ? it : m_addresses.end();
            }
            else
            {
                return std::find(m_addresses.begin(), m_addresses.end(), address);
            }
        }

        BitIndex m_nextBit = 0;
        std::vector<Address> m_addresses;
        std::map<BitIndex, Address> m_bitToAddress;
    };

    static_assert(BitAllocator<ComponentRegister>);
}
