#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "../Core/Error.hpp"
#include "../Core/Result.hpp"

namespace Cosmos
{
    using Bytes = std::vector<std::byte>;

    /**
     * @brief Durable keyed blob store holding the persisted aggregates.
     *
     * Cosmos only needs get/set/has/erase by key. A key that was never written
     * reads back as an empty optional; failures of the medium are reported as
     * StorageError. Erasing an absent key succeeds.
     */
    class Store
    {
    public:
        virtual ~Store() = default;

        COSMOS_NODISCARD virtual Result<bool, Error> Has(std::string_view key) const = 0;
        COSMOS_NODISCARD virtual Result<std::optional<Bytes>, Error> Get(std::string_view key) const = 0;
        COSMOS_NODISCARD virtual Result<void, Error> Set(std::string_view key, std::span<const std::byte> value) = 0;
        COSMOS_NODISCARD virtual Result<void, Error> Erase(std::string_view key) = 0;
    };
}
