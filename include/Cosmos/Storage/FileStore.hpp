#pragma once

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "../Core/Log.hpp"
#include "Store.hpp"

namespace Cosmos
{
    /**
     * @brief Store backed by one file per key under a root directory.
     *
     * Set() writes "<key>.rec.tmp" and renames it over "<key>.rec", so a reader
     * sees either the previous blob or the new one, never a partial write.
     */
    class FileStore final : public Store
    {
    public:
        struct Config
        {
            std::filesystem::path root;
            bool createIfMissing = true;
            std::string extension = ".rec";
        };

        explicit FileStore(Config config) : m_config(std::move(config)) {}

        explicit FileStore(const std::filesystem::path& root)
            : FileStore(Config{root})
        {
        }

        /**
         * Create the root directory if configured to, and check that it is a directory.
         */
        COSMOS_NODISCARD Result<void, Error> Open()
        {
            std::error_code ec;
            if (!std::filesystem::exists(m_config.root, ec))
            {
                if (!m_config.createIfMissing)
                {
                    COSMOS_LOG_ERROR("store root {} does not exist", m_config.root.string());
                    return Err(MakeError(ErrorCode::StorageError, "Store root directory does not exist"));
                }

                std::filesystem::create_directories(m_config.root, ec);
                if (ec)
                {
                    COSMOS_LOG_ERROR("cannot create store root {}: {}", m_config.root.string(), ec.message());
                    return Err(MakeError(ErrorCode::StorageError, "Cannot create store root directory"));
                }
            }

            if (!std::filesystem::is_directory(m_config.root, ec))
            {
                COSMOS_LOG_ERROR("store root {} is not a directory", m_config.root.string());
                return Err(MakeError(ErrorCode::StorageError, "Store root is not a directory"));
            }

            return {};
        }

        Result<bool, Error> Has(std::string_view key) const override
        {
            if (!IsValidKey(key))
            {
                return Err(MakeError(ErrorCode::InvalidArgument, "Store keys are limited to [a-z0-9_-]"));
            }

            std::error_code ec;
            const bool exists = std::filesystem::is_regular_file(PathFor(key), ec);
            if (ec && ec != std::errc::no_such_file_or_directory)
            {
                COSMOS_LOG_ERROR("cannot stat {}: {}", PathFor(key).string(), ec.message());
                return Err(MakeError(ErrorCode::StorageError, "Cannot stat store entry"));
            }
            return exists;
        }

        Result<std::optional<Bytes>, Error> Get(std::string_view key) const override
        {
            auto present = Has(key);
            if (present.IsErr())
            {
                return Err(present.Error());
            }
            if (!present.Value())
            {
                return std::optional<Bytes>{};
            }

            const auto path = PathFor(key);
            std::ifstream file(path, std::ios::binary | std::ios::ate);
            if (!file.is_open())
            {
                COSMOS_LOG_ERROR("cannot open {} for reading", path.string());
                return Err(MakeError(ErrorCode::StorageError, "Cannot open store entry"));
            }

            const std::streamsize size = file.tellg();
            file.seekg(0, std::ios::beg);

            Bytes data(static_cast<std::size_t>(std::max<std::streamsize>(size, 0)));
            if (!data.empty() && !file.read(reinterpret_cast<char*>(data.data()), size))
            {
                COSMOS_LOG_ERROR("short read from {}", path.string());
                return Err(MakeError(ErrorCode::StorageError, "Cannot read store entry"));
            }

            return std::optional<Bytes>(std::move(data));
        }

        Result<void, Error> Set(std::string_view key, std::span<const std::byte> value) override
        {
            if (!IsValidKey(key))
            {
                return Err(MakeError(ErrorCode::InvalidArgument, "Store keys are limited to [a-z0-9_-]"));
            }

            const auto path = PathFor(key);
            auto temp = path;
            temp += ".tmp";

            {
                std::ofstream file(temp, std::ios::binary | std::ios::out | std::ios::trunc);
                if (!file.is_open())
                {
                    COSMOS_LOG_ERROR("cannot open {} for writing", temp.string());
                    return Err(MakeError(ErrorCode::StorageError, "Cannot open store entry for writing"));
                }

                file.write(reinterpret_cast<const char*>(value.data()), static_cast<std::streamsize>(value.size()));
                file.flush();
                if (!file.good())
                {
                    COSMOS_LOG_ERROR("write to {} failed", temp.string());
                    return Err(MakeError(ErrorCode::StorageError, "Cannot write store entry"));
                }
            }

            std::error_code ec;
            std::filesystem::rename(temp, path, ec);
            if (ec)
            {
                COSMOS_LOG_ERROR("cannot replace {}: {}", path.string(), ec.message());
                std::filesystem::remove(temp, ec);
                return Err(MakeError(ErrorCode::StorageError, "Cannot replace store entry"));
            }

            return {};
        }

        Result<void, Error> Erase(std::string_view key) override
        {
            if (!IsValidKey(key))
            {
                return Err(MakeError(ErrorCode::InvalidArgument, "Store keys are limited to [a-z0-9_-]"));
            }

            std::error_code ec;
            std::filesystem::remove(PathFor(key), ec);
            if (ec)
            {
                COSMOS_LOG_ERROR("cannot remove {}: {}", PathFor(key).string(), ec.message());
                return Err(MakeError(ErrorCode::StorageError, "Cannot remove store entry"));
            }
            return {};
        }

        COSMOS_NODISCARD const std::filesystem::path& Root() const noexcept { return m_config.root; }

        COSMOS_NODISCARD std::filesystem::path PathFor(std::string_view key) const
        {
            return m_config.root / (std::string(key) + m_config.extension);
        }

        COSMOS_NODISCARD static bool IsValidKey(std::string_view key) noexcept
        {
            return !key.empty() && std::all_of(key.begin(), key.end(), [](char c)
            {
                return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
            });
        }

    private:
        Config m_config;
    };
}
