#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include <fmt/format.h>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Hash.hpp"

namespace Cosmos
{
    /**
     * Fixed-width bitmap stored as 64-bit words, least significant word first.
     * Ordering and formatting treat the bitmap as one unsigned integer of Bits width.
     */
    template<std::size_t Bits>
    class Bitmap
    {
        static_assert(Bits > 0 && Bits % 64 == 0, "Bitmap width must be a multiple of 64");

    public:
        static constexpr std::size_t BITS = Bits;
        static constexpr std::size_t BITS_PER_WORD = 64;
        static constexpr std::size_t WORD_COUNT = Bits / BITS_PER_WORD;

        using Word = std::uint64_t;

        constexpr Bitmap() noexcept : m_words{} {}

        // Bitmap holding the low 64 bits of value
        constexpr explicit Bitmap(Word value) noexcept : m_words{}
        {
            m_words[0] = value;
        }

        // Single-bit bitmap (1 << index); empty when index is out of range
        COSMOS_NODISCARD static constexpr Bitmap FromBit(std::size_t index) noexcept
        {
            Bitmap bitmap;
            bitmap.Set(index);
            return bitmap;
        }

        constexpr void Set(std::size_t index) noexcept
        {
            if (index < Bits) COSMOS_LIKELY
            {
                m_words[index / BITS_PER_WORD] |= (Word(1) << (index % BITS_PER_WORD));
            }
        }

        constexpr void Reset(std::size_t index) noexcept
        {
            if (index < Bits) COSMOS_LIKELY
            {
                m_words[index / BITS_PER_WORD] &= ~(Word(1) << (index % BITS_PER_WORD));
            }
        }

        COSMOS_NODISCARD constexpr bool Test(std::size_t index) const noexcept
        {
            if (index >= Bits) COSMOS_UNLIKELY return false;
            return (m_words[index / BITS_PER_WORD] & (Word(1) << (index % BITS_PER_WORD))) != 0;
        }

        // Containment test used for query matching: (*this & mask) == mask
        COSMOS_NODISCARD constexpr bool HasAll(const Bitmap& mask) const noexcept
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                if ((m_words[i] & mask.m_words[i]) != mask.m_words[i])
                    return false;
            }
            return true;
        }

        COSMOS_NODISCARD constexpr bool HasAny(const Bitmap& mask) const noexcept
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                if ((m_words[i] & mask.m_words[i]) != 0)
                    return true;
            }
            return false;
        }

        COSMOS_NODISCARD constexpr bool operator==(const Bitmap& other) const noexcept = default;

        // Numeric ordering, most significant word first
        COSMOS_NODISCARD constexpr bool operator<(const Bitmap& other) const noexcept
        {
            for (std::size_t i = WORD_COUNT; i-- > 0;)
            {
                if (m_words[i] != other.m_words[i])
                    return m_words[i] < other.m_words[i];
            }
            return false;
        }

        COSMOS_NODISCARD constexpr Bitmap operator|(const Bitmap& other) const noexcept
        {
            Bitmap result = *this;
            result |= other;
            return result;
        }

        constexpr Bitmap& operator|=(const Bitmap& other) noexcept
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                m_words[i] |= other.m_words[i];
            }
            return *this;
        }

        COSMOS_NODISCARD constexpr Bitmap operator&(const Bitmap& other) const noexcept
        {
            Bitmap result;
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                result.m_words[i] = m_words[i] & other.m_words[i];
            }
            return result;
        }

        COSMOS_NODISCARD constexpr std::size_t Count() const noexcept
        {
            std::size_t count = 0;
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                count += static_cast<std::size_t>(std::popcount(m_words[i]));
            }
            return count;
        }

        COSMOS_NODISCARD constexpr bool Any() const noexcept
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                if (m_words[i] != 0) return true;
            }
            return false;
        }

        COSMOS_NODISCARD constexpr bool None() const noexcept
        {
            return !Any();
        }

        COSMOS_NODISCARD std::size_t GetHash() const noexcept
        {
            std::uint64_t hash = 0;
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                hash = HashCombine(hash, m_words[i]);
            }
            return static_cast<std::size_t>(hash);
        }

        COSMOS_NODISCARD constexpr Word GetWord(std::size_t index) const noexcept
        {
            return index < WORD_COUNT ? m_words[index] : 0;
        }

        COSMOS_NODISCARD const Word* Data() const noexcept { return m_words.data(); }
        COSMOS_NODISCARD Word* Data() noexcept { return m_words.data(); }

        // Hexadecimal rendering without leading zeros, e.g. "0x6"
        COSMOS_NODISCARD std::string ToHexString() const
        {
            std::string out;
            for (std::size_t i = WORD_COUNT; i-- > 0;)
            {
                if (out.empty())
                {
                    if (m_words[i] != 0)
                        out = fmt::format("{:x}", m_words[i]);
                }
                else
                {
                    out += fmt::format("{:016x}", m_words[i]);
                }
            }
            return "0x" + (out.empty() ? std::string("0") : out);
        }

    private:
        std::array<Word, WORD_COUNT> m_words;
    };

    template<std::size_t Bits>
    struct BitmapHash
    {
        std::size_t operator()(const Bitmap<Bits>& bitmap) const noexcept
        {
            return bitmap.GetHash();
        }
    };

    // The one bitmap type shared by allocator bits, entity masks and system queries
    using Mask = Bitmap<config::BITMAP_BITS>;
    using Query = Mask;
}

namespace std
{
    template<std::size_t Bits>
    struct hash<Cosmos::Bitmap<Bits>>
    {
        std::size_t operator()(const Cosmos::Bitmap<Bits>& bitmap) const noexcept
        {
            return bitmap.GetHash();
        }
    };
}

template<std::size_t Bits>
struct fmt::formatter<Cosmos::Bitmap<Bits>> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(const Cosmos::Bitmap<Bits>& bitmap, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(bitmap.ToHexString(), ctx);
    }
};
