#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "Cosmos/Address/Address.hpp"
#include "Cosmos/Core/Log.hpp"
#include "Cosmos/Storage/MemoryStore.hpp"

namespace Cosmos::Test
{
    // Deterministic contract-style address, e.g. MakeAddress(3) -> "CCOMP0003"
    inline Address MakeAddress(std::size_t index, std::string_view prefix = "CCOMP")
    {
        return Address(fmt::format("{}{:04}", prefix, index));
    }

    inline std::vector<Address> MakeAddresses(std::size_t count, std::string_view prefix = "CCOMP")
    {
        std::vector<Address> out;
        out.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            out.push_back(MakeAddress(i, prefix));
        }
        return out;
    }

    /**
     * Redirects Cosmos logging into memory for the lifetime of the object.
     * Restores the stderr sink and the previous minimum level on destruction.
     */
    class LogCapture
    {
    public:
        struct Line
        {
            LogLevel level;
            std::string text;
        };

        explicit LogCapture(LogLevel minLevel = LogLevel::Debug)
            : m_previousLevel(Log::Get().GetMinLevel())
        {
            Log::Get().SetMinLevel(minLevel);
            Log::Get().SetOutput([this](LogLevel level, std::string_view message)
            {
                m_lines.push_back(Line{level, std::string(message)});
            });
        }

        ~LogCapture()
        {
            Log::Get().SetOutput({});
            Log::Get().SetMinLevel(m_previousLevel);
        }

        LogCapture(const LogCapture&) = delete;
        LogCapture& operator=(const LogCapture&) = delete;

        const std::vector<Line>& Lines() const { return m_lines; }

        std::size_t Count(LogLevel level) const
        {
            std::size_t n = 0;
            for (const Line& line : m_lines)
            {
                if (line.level == level) ++n;
            }
            return n;
        }

        bool Contains(std::string_view needle) const
        {
            for (const Line& line : m_lines)
            {
                if (line.text.find(needle) != std::string::npos) return true;
            }
            return false;
        }

        void Clear() { m_lines.clear(); }

    private:
        std::vector<Line> m_lines;
        LogLevel m_previousLevel;
    };

    // Memory store whose writes to one key fail with StorageError until Heal() is called
    class FaultyStore final : public Store
    {
    public:
        void FailWritesTo(std::string_view key) { m_failKey = std::string(key); }
        void Heal() { m_failKey.clear(); }

        Result<bool, Error> Has(std::string_view key) const override { return m_inner.Has(key); }
        Result<std::optional<Bytes>, Error> Get(std::string_view key) const override { return m_inner.Get(key); }

        Result<void, Error> Set(std::string_view key, std::span<const std::byte> value) override
        {
            if (!m_failKey.empty() && key == m_failKey)
            {
                return Err(MakeError(ErrorCode::StorageError, "injected failure"));
            }
            return m_inner.Set(key, value);
        }

        Result<void, Error> Erase(std::string_view key) override { return m_inner.Erase(key); }

        MemoryStore& Inner() { return m_inner; }

    private:
        std::string m_failKey;
        MemoryStore m_inner;
    };

    // Unique directory under the system temp path, removed with its contents on destruction
    class ScopedTempDir
    {
    public:
        ScopedTempDir()
        {
            static std::atomic<unsigned> sequence{0};
            const auto stamp = std::filesystem::file_time_type::clock::now().time_since_epoch().count();
            m_path = std::filesystem::temp_directory_path() /
                fmt::format("cosmos-test-{}-{}", stamp, sequence.fetch_add(1));
            std::filesystem::create_directories(m_path);
        }

        ~ScopedTempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(m_path, ec);
        }

        ScopedTempDir(const ScopedTempDir&) = delete;
        ScopedTempDir& operator=(const ScopedTempDir&) = delete;

        const std::filesystem::path& Path() const { return m_path; }

    private:
        std::filesystem::path m_path;
    };
}
