#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "../Address/Address.hpp"
#include "../Container/Bitmap.hpp"
#include "../Core/Error.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "../Registry/BitAllocator.hpp"
#include "Entity.hpp"

namespace Cosmos
{
    /**
     * @brief The singleton world aggregate: entity table and system registry.
     *
     * World is a plain value. WorldLedger loads it from the store, applies one
     * operation and writes it back, so every mutation here is local until committed.
     *
     * Entity ids come from a counter that starts at 0 and is incremented before
     * use; the first entity is 1 and ids are never reused. Entity records are
     * immutable once stored: Despawn releases a component address in the allocator
     * and leaves every record, including masks that still carry the released bit,
     * untouched.
     */
    class World
    {
    public:
        using EntityTable = std::map<EntityID, EntityRecord>;
        using SystemTable = std::map<Query, Address>;

        World() = default;
        explicit World(std::string name) : m_name(std::move(name)) {}

        /**
         * Create an entity from the components that allocator accepts as new.
         *
         * Components are registered left to right; those that already own a bit
         * (including a repeat within the same call) are left out of both the mask
         * and the stored component list. If none is accepted, no id is consumed and
         * the outcome reports created = false.
         *
         * On error the world is unchanged, but allocator may hold registrations made
         * for earlier components of this call; callers drop both aggregates.
         */
        template<BitAllocator Allocator>
        Result<SpawnOutcome, Error> Spawn(Allocator& allocator, std::span<const Address> components)
        {
            COSMOS_PROFILE_FUNCTION();

            std::optional<Mask> composite;
            std::vector<Address> accepted;

            for (const Address& component : components)
            {
                auto bit = allocator.Register(component);
                if (bit.IsErr())
                {
                    return Err(bit.Error());
                }

                if (const std::optional<Mask>& mask = bit.Value(); mask.has_value())
                {
                    composite = composite.has_value() ? (*composite | *mask) : *mask;
                    accepted.push_back(component);
                }
            }

            if (!composite.has_value())
            {
                return SpawnOutcome{};
            }

            const EntityID id = ++m_counter;
            m_entities[id] = EntityRecord{*composite, std::move(accepted)};

            return SpawnOutcome{true, id};
        }

        /**
         * Release component in allocator. Entity records are not consulted.
         * @return true if the allocator had the address registered
         */
        template<BitAllocator Allocator>
        bool Despawn(Allocator& allocator, const Address& component) const
        {
            COSMOS_PROFILE_FUNCTION();
            return allocator.Unregister(component);
        }

        /**
         * Map query to handler, replacing any handler already registered for the exact same mask.
         * @return the handler that was replaced, if any
         */
        std::optional<Address> AddSystem(const Query& query, const Address& handler)
        {
            std::optional<Address> previous;
            auto it = m_systems.find(query);
            if (it != m_systems.end())
            {
                previous = std::exchange(it->second, handler);
            }
            else
            {
                m_systems.emplace(query, handler);
            }
            return previous;
        }

        // Returns false when no handler was registered for query
        bool RemoveSystem(const Query& query)
        {
            return m_systems.erase(query) > 0;
        }

        COSMOS_NODISCARD const std::string& Name() const noexcept { return m_name; }
        COSMOS_NODISCARD EntityID Counter() const noexcept { return m_counter; }
        COSMOS_NODISCARD const EntityTable& Entities() const noexcept { return m_entities; }
        COSMOS_NODISCARD const SystemTable& Systems() const noexcept { return m_systems; }
        COSMOS_NODISCARD std::size_t EntityCount() const noexcept { return m_entities.size(); }
        COSMOS_NODISCARD std::size_t SystemCount() const noexcept { return m_systems.size(); }

        COSMOS_NODISCARD const EntityRecord* FindEntity(EntityID id) const
        {
            auto it = m_entities.find(id);
            return it != m_entities.end() ? &it->second : nullptr;
        }

        COSMOS_NODISCARD const Address* FindSystem(const Query& query) const
        {
            auto it = m_systems.find(query);
            return it != m_systems.end() ? &it->second : nullptr;
        }

        /**
         * Structural checks applied to worlds loaded from storage
         */
        COSMOS_NODISCARD bool IsConsistent() const
        {
            if (!m_entities.empty() && (m_entities.begin()->first == INVALID_ENTITY_ID || m_entities.rbegin()->first > m_counter))
            {
                return false;
            }

            for (const auto& [id, record] : m_entities)
            {
                if (record.mask.None() || record.mask.Test(0) || record.components.empty())
                {
                    return false;
                }
            }
            return true;
        }

        bool operator==(const World& other) const = default;

        template<typename Writer>
        void Serialize(Writer& writer) const
        {
            writer(m_name)(m_counter)(m_entities)(m_systems);
        }

        template<typename Reader>
        void Deserialize(Reader& reader)
        {
            reader(m_name)(m_counter)(m_entities)(m_systems);
        }

    private:
        std::string m_name;
        EntityID m_counter = 0;
        EntityTable m_entities;
        SystemTable m_systems;
    };
}
