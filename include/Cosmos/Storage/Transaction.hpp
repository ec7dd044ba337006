#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../Core/Log.hpp"
#include "../Core/Profile.hpp"
#include "Store.hpp"

namespace Cosmos
{
    /**
     * @brief Write-staging view over a Store.
     *
     * Reads see staged values first, then the underlying store. Writes and erases
     * are held until Commit(), which applies them in the order they were first
     * staged. A transaction destroyed without Commit() leaves the store untouched,
     * which is how a failed ledger operation discards its partial work.
     */
    class Transaction final : public Store
    {
    public:
        explicit Transaction(Store& target) : m_target(target) {}

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        Result<bool, Error> Has(std::string_view key) const override
        {
            if (auto it = FindStaged(key); it != m_staged.end())
            {
                return it->second.has_value();
            }
            return m_target.Has(key);
        }

        Result<std::optional<Bytes>, Error> Get(std::string_view key) const override
        {
            if (auto it = FindStaged(key); it != m_staged.end())
            {
                return it->second;
            }
            return m_target.Get(key);
        }

        Result<void, Error> Set(std::string_view key, std::span<const std::byte> value) override
        {
            return Stage(key, Bytes(value.begin(), value.end()));
        }

        Result<void, Error> Erase(std::string_view key) override
        {
            return Stage(key, std::nullopt);
        }

        /**
         * Apply staged entries to the underlying store. The prior value of every key
         * is read before it is overwritten; if a read or write fails, the keys already
         * applied are restored in reverse order (or erased when they were absent)
         * and the original error is returned. The transaction stays uncommitted.
         */
        COSMOS_NODISCARD Result<void, Error> Commit()
        {
            COSMOS_PROFILE_ZONE_NAMED("Transaction::Commit");

            if (m_committed)
            {
                return Err(MakeError(ErrorCode::InvalidArgument, "Transaction already committed"));
            }

            std::vector<Entry> applied;
            applied.reserve(m_staged.size());

            for (const auto& [key, value] : m_staged)
            {
                auto prior = m_target.Get(key);
                if (prior.IsErr())
                {
                    COSMOS_LOG_ERROR("commit cannot read key '{}': {}", key, prior.Error());
                    Restore(applied);
                    return Err(prior.Error());
                }

                auto written = Apply(key, value);
                if (written.IsErr())
                {
                    COSMOS_LOG_ERROR("commit failed at key '{}': {}", key, written.Error());
                    Restore(applied);
                    return written;
                }
                applied.emplace_back(key, std::move(prior.Value()));
            }

            m_committed = true;
            m_staged.clear();
            return {};
        }

        void Rollback() noexcept
        {
            m_staged.clear();
        }

        COSMOS_NODISCARD bool IsDirty() const noexcept { return !m_staged.empty(); }
        COSMOS_NODISCARD std::size_t StagedCount() const noexcept { return m_staged.size(); }

    private:
        // An empty value marks a staged erase
        using Entry = std::pair<std::string, std::optional<Bytes>>;

        std::vector<Entry>::const_iterator FindStaged(std::string_view key) const
        {
            return std::find_if(m_staged.begin(), m_staged.end(), [key](const Entry& entry) { return entry.first == key; });
        }

        Result<void, Error> Stage(std::string_view key, std::optional<Bytes> value)
        {
            if (m_committed)
            {
                return Err(MakeError(ErrorCode::InvalidArgument, "Transaction already committed"));
            }

            auto it = std::find_if(m_staged.begin(), m_staged.end(), [key](const Entry& entry) { return entry.first == key; });
            if (it != m_staged.end())
            {
                it->second = std::move(value);
            }
            else
            {
                m_staged.emplace_back(std::string(key), std::move(value));
            }
            return {};
        }

        Result<void, Error> Apply(std::string_view key, const std::optional<Bytes>& value)
        {
            if (value)
            {
                return m_target.Set(key, *value);
            }
            return m_target.Erase(key);
        }

        void Restore(const std::vector<Entry>& applied)
        {
            for (auto it = applied.rbegin(); it != applied.rend(); ++it)
            {
                auto restored = Apply(it->first, it->second);
                if (restored.IsErr())
                {
                    COSMOS_LOG_ERROR("cannot restore key '{}' after failed commit: {}", it->first, restored.Error());
                }
            }
        }

        Store& m_target;
        std::vector<Entry> m_staged;
        bool m_committed = false;
    };
}
