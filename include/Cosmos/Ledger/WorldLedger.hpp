#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "../Core/Config.hpp"
#include "../Core/Log.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Version.hpp"
#include "../Storage/Records.hpp"
#include "../Storage/Store.hpp"
#include "../Storage/Transaction.hpp"

namespace Cosmos
{
    /**
     * @brief Entry points of a Cosmos deployment.
     *
     * Each operation loads the aggregates it needs from the store, applies the
     * change to those local copies and commits every write at once through a
     * Transaction. A failing operation returns its error and writes nothing.
     *
     * Until Genesis() has run, Spawn, Despawn, AddSystem and RemoveSystem are
     * silent no-ops and GetWorld() fails with WorldNotCreated.
     *
     * Not thread-safe; callers serialize operations on one store.
     */
    class WorldLedger
    {
    public:
        struct Config
        {
            // Level used for operations that were accepted but changed nothing
            LogLevel noOpLevel = LogLevel::Debug;
            bool verifyChecksums = true;
        };

        explicit WorldLedger(Store& store) : WorldLedger(store, Config{}) {}
        WorldLedger(Store& store, Config config) : m_store(store), m_config(config) {}

        /**
         * Create the world once. Later calls return success without touching the store.
         */
        Result<void, Error> Genesis(std::string name)
        {
            COSMOS_PROFILE_FUNCTION();

            Transaction tx(m_store);
            auto created = CheckGenesis(tx);
            if (created.IsErr())
            {
                return Err(created.Error());
            }
            if (created.Value())
            {
                NoOp("genesis '{}' ignored: world already exists", name);
                return {};
            }

            // World before flag: a flag must never point at a missing world
            if (auto saved = SaveRecord(tx, config::WORLD_KEY, World(name)); saved.IsErr())
            {
                return saved;
            }
            if (auto saved = SaveRecord(tx, config::GENESIS_KEY, true); saved.IsErr())
            {
                return saved;
            }

            if (auto committed = tx.Commit(); committed.IsErr())
            {
                return committed;
            }

            COSMOS_LOG_INFO("genesis: world '{}' created (cosmos {}.{}.{})", name, VERSION_MAJOR, VERSION_MINOR, VERSION_PATCH);
            return {};
        }

        COSMOS_NODISCARD Result<bool, Error> IsGenesis() const
        {
            return CheckGenesis(m_store);
        }

        /**
         * Snapshot of the persisted world
         */
        COSMOS_NODISCARD Result<World, Error> GetWorld() const
        {
            auto world = LoadRecord<World>(m_store, config::WORLD_KEY, m_config.verifyChecksums);
            if (world.IsErr())
            {
                return Err(world.Error());
            }
            if (!world.Value().has_value())
            {
                return Err(MakeError(ErrorCode::WorldNotCreated));
            }
            return std::move(*world.Value());
        }

        /**
         * Snapshot of the component register; RegistryMissing until the first registration
         */
        COSMOS_NODISCARD Result<ComponentRegister, Error> GetRegister() const
        {
            auto reg = LoadRecord<ComponentRegister>(m_store, config::REGISTER_KEY, m_config.verifyChecksums);
            if (reg.IsErr())
            {
                return Err(reg.Error());
            }
            if (!reg.Value().has_value())
            {
                return Err(MakeError(ErrorCode::RegistryMissing));
            }
            return std::move(*reg.Value());
        }

        /**
         * Create an entity from the components that are not yet registered.
         * Persists only when an entity was created.
         */
        Result<void, Error> Spawn(std::span<const Address> components)
        {
            COSMOS_PROFILE_FUNCTION();

            Transaction tx(m_store);
            auto guard = CheckGenesis(tx);
            if (guard.IsErr())
            {
                return Err(guard.Error());
            }
            if (!guard.Value())
            {
                NoOp("spawn ignored: genesis has not run");
                return {};
            }

            auto world = LoadExistingWorld(tx);
            if (world.IsErr())
            {
                return Err(world.Error());
            }

            auto loaded = LoadRecord<ComponentRegister>(tx, config::REGISTER_KEY, m_config.verifyChecksums);
            if (loaded.IsErr())
            {
                return Err(loaded.Error());
            }
            ComponentRegister reg = std::move(loaded.Value()).value_or(ComponentRegister{});

            auto outcome = world.Value().Spawn(reg, components);
            if (outcome.IsErr())
            {
                COSMOS_LOG_WARN("spawn of {} component(s) rejected: {}", components.size(), outcome.Error());
                return Err(outcome.Error());
            }

            if (!outcome.Value().created)
            {
                NoOp("spawn created no entity: none of {} component(s) was new", components.size());
                return {};
            }

            if (auto saved = SaveRecord(tx, config::REGISTER_KEY, reg); saved.IsErr())
            {
                return saved;
            }
            if (auto saved = SaveRecord(tx, config::WORLD_KEY, world.Value()); saved.IsErr())
            {
                return saved;
            }
            if (auto committed = tx.Commit(); committed.IsErr())
            {
                return committed;
            }

            const EntityRecord* record = world.Value().FindEntity(outcome.Value().id);
            COSMOS_LOG_INFO("spawned entity {} with mask {} [{}]", outcome.Value().id, record->mask,
                fmt::join(record->components, ", "));
            COSMOS_PROFILE_PLOT("cosmos.components.remaining", static_cast<std::int64_t>(reg.Remaining()));
            return {};
        }

        Result<void, Error> Spawn(const std::vector<Address>& components)
        {
            return Spawn(std::span<const Address>(components));
        }

        /**
         * Release a component address. Entity records keep their masks and component lists.
         */
        Result<void, Error> Despawn(const Address& component)
        {
            COSMOS_PROFILE_FUNCTION();

            Transaction tx(m_store);
            auto guard = CheckGenesis(tx);
            if (guard.IsErr())
            {
                return Err(guard.Error());
            }
            if (!guard.Value())
            {
                NoOp("despawn of {} ignored: genesis has not run", component);
                return {};
            }

            auto world = LoadExistingWorld(tx);
            if (world.IsErr())
            {
                return Err(world.Error());
            }

            auto loaded = LoadRecord<ComponentRegister>(tx, config::REGISTER_KEY, m_config.verifyChecksums);
            if (loaded.IsErr())
            {
                return Err(loaded.Error());
            }
            if (!loaded.Value().has_value())
            {
                COSMOS_LOG_WARN("despawn of {} rejected: no component has been registered yet", component);
                return Err(MakeError(ErrorCode::RegistryMissing, "Cannot unregister before any registration has occurred"));
            }

            ComponentRegister& reg = *loaded.Value();
            if (!world.Value().Despawn(reg, component))
            {
                NoOp("despawn of {} changed nothing: address is not registered", component);
                return {};
            }

            if (auto saved = SaveRecord(tx, config::REGISTER_KEY, reg); saved.IsErr())
            {
                return saved;
            }
            if (auto committed = tx.Commit(); committed.IsErr())
            {
                return committed;
            }

            COSMOS_LOG_INFO("despawned component {}", component);
            return {};
        }

        /**
         * Register handler for query, replacing any handler already bound to the same mask
         */
        Result<void, Error> AddSystem(const Query& query, const Address& handler)
        {
            COSMOS_PROFILE_FUNCTION();

            Transaction tx(m_store);
            auto guard = CheckGenesis(tx);
            if (guard.IsErr())
            {
                return Err(guard.Error());
            }
            if (!guard.Value())
            {
                NoOp("add system {} ignored: genesis has not run", query);
                return {};
            }

            auto world = LoadExistingWorld(tx);
            if (world.IsErr())
            {
                return Err(world.Error());
            }

            const auto replaced = world.Value().AddSystem(query, handler);

            if (auto saved = SaveRecord(tx, config::WORLD_KEY, world.Value()); saved.IsErr())
            {
                return saved;
            }
            if (auto committed = tx.Commit(); committed.IsErr())
            {
                return committed;
            }

            if (replaced.has_value())
                COSMOS_LOG_INFO("system {} rebound from {} to {}", query, *replaced, handler);
            else
                COSMOS_LOG_INFO("system {} bound to {}", query, handler);
            return {};
        }

        Result<void, Error> RemoveSystem(const Query& query)
        {
            COSMOS_PROFILE_FUNCTION();

            Transaction tx(m_store);
            auto guard = CheckGenesis(tx);
            if (guard.IsErr())
            {
                return Err(guard.Error());
            }
            if (!guard.Value())
            {
                NoOp("remove system {} ignored: genesis has not run", query);
                return {};
            }

            auto world = LoadExistingWorld(tx);
            if (world.IsErr())
            {
                return Err(world.Error());
            }

            if (!world.Value().RemoveSystem(query))
            {
                NoOp("remove system {} changed nothing: no handler bound", query);
                return {};
            }

            if (auto saved = SaveRecord(tx, config::WORLD_KEY, world.Value()); saved.IsErr())
            {
                return saved;
            }
            if (auto committed = tx.Commit(); committed.IsErr())
            {
                return committed;
            }

            COSMOS_LOG_INFO("system {} removed", query);
            return {};
        }

        COSMOS_NODISCARD const Config& GetConfig() const noexcept { return m_config; }

    private:
        Result<bool, Error> CheckGenesis(const Store& store) const
        {
            auto flag = LoadRecord<bool>(store, config::GENESIS_KEY, m_config.verifyChecksums);
            if (flag.IsErr())
            {
                return Err(flag.Error());
            }
            return flag.Value().value_or(false);
        }

        // The world record of a store whose genesis flag is set
        Result<World, Error> LoadExistingWorld(const Store& store) const
        {
            auto world = LoadRecord<World>(store, config::WORLD_KEY, m_config.verifyChecksums);
            if (world.IsErr())
            {
                return Err(world.Error());
            }
            if (!world.Value().has_value())
            {
                COSMOS_LOG_ERROR("genesis flag is set but the world record is missing");
                return Err(MakeError(ErrorCode::CorruptedRecord, "Genesis flag set without a world record"));
            }
            return std::move(*world.Value());
        }

        template<typename... Args>
        void NoOp(fmt::format_string<Args...> format, Args&&... args) const
        {
            Log::Get().WriteFormat(m_config.noOpLevel, format, std::forward<Args>(args)...);
        }

        Store& m_store;
        Config m_config;
    };
}
