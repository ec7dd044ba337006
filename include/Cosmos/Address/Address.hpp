#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "../Core/Base.hpp"
#include "../Core/Hash.hpp"

namespace Cosmos
{
    /**
     * Opaque caller/component identity. Cosmos never interprets the contents;
     * it only compares, orders, hashes and persists them.
     */
    class Address
    {
    public:
        Address() = default;
        explicit Address(std::string value) : m_value(std::move(value)) {}
        explicit Address(std::string_view value) : m_value(value) {}
        explicit Address(const char* value) : m_value(value) {}

        COSMOS_NODISCARD const std::string& Value() const noexcept { return m_value; }
        COSMOS_NODISCARD bool Empty() const noexcept { return m_value.empty(); }

        COSMOS_NODISCARD bool operator==(const Address& other) const = default;
        COSMOS_NODISCARD std::strong_ordering operator<=>(const Address& other) const = default;

        template<typename Writer>
        void Serialize(Writer& writer) const
        {
            writer(m_value);
        }

        template<typename Reader>
        void Deserialize(Reader& reader)
        {
            reader(m_value);
        }

    private:
        std::string m_value;
    };

    struct AddressHash
    {
        std::size_t operator()(const Address& address) const noexcept
        {
            const auto& value = address.Value();
            return static_cast<std::size_t>(HashBytes(value.data(), value.size()));
        }
    };
}

namespace std
{
    template<>
    struct hash<Cosmos::Address>
    {
        std::size_t operator()(const Cosmos::Address& address) const noexcept
        {
            return Cosmos::AddressHash{}(address);
        }
    };
}

template<>
struct fmt::formatter<Cosmos::Address> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(const Cosmos::Address& address, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(address.Value(), ctx);
    }
};
