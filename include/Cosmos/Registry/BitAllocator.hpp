#pragma once

#include <concepts>
#include <optional>

#include "../Address/Address.hpp"
#include "../Container/Bitmap.hpp"
#include "../Core/Error.hpp"
#include "../Core/Result.hpp"

namespace Cosmos
{
    /**
     * @brief Capability that hands out component bits to addresses.
     *
     * Register() yields the single-bit mask allocated to a newly seen address, an empty
     * optional when the address already owns a bit, or an error when no bit can be
     * allocated. Unregister() releases the address and reports whether it was present.
     *
     * ComponentRegister is the production allocator; World is templated on this concept
     * so tests can drive it with scripted allocators.
     */
    template<typename T>
    concept BitAllocator = requires(T& allocator, const Address& address)
    {
        { allocator.Register(address) } -> std::same_as<Result<std::optional<Mask>, Error>>;
        { allocator.Unregister(address) } -> std::same_as<bool>;
    };
}
