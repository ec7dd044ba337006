#pragma once

#include <cstdint>
#include <vector>

#include "../Address/Address.hpp"
#include "../Container/Bitmap.hpp"

namespace Cosmos
{
    using EntityID = std::uint64_t;

    inline constexpr EntityID INVALID_ENTITY_ID = 0;

    /**
     * Stored state of a spawned entity: the composite mask of the components that
     * were newly registered for it, and those components in request order.
     * Records are written once by Spawn and never rewritten.
     */
    struct EntityRecord
    {
        Mask mask;
        std::vector<Address> components;

        bool operator==(const EntityRecord& other) const = default;

        template<typename Writer>
        void Serialize(Writer& writer) const
        {
            writer(mask)(components);
        }

        template<typename Reader>
        void Deserialize(Reader& reader)
        {
            reader(mask)(components);
        }
    };

    struct SpawnOutcome
    {
        bool created = false;
        EntityID id = INVALID_ENTITY_ID;
    };
}
