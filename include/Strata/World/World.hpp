#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../Archetype/Archetype.hpp"
#include "../Archetype/BorrowState.hpp"
#include "../Component/Bundle.hpp"
#include "../Component/Component.hpp"
#include "../Component/ComponentRegistry.hpp"
#include "../Component/Signature.hpp"
#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Error.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "../Core/TypeID.hpp"
#include "../Entity/Entity.hpp"
#include "../Entity/EntityAllocator.hpp"
#include "EntityBuilder.hpp"
#include "EntityRef.hpp"
#include "Query.hpp"
#include "Ref.hpp"

namespace Strata
{
    /**
     * Owns every entity, archetype and component value, and moves entities between
     * archetypes as their component sets change.
     *
     * Each operation validates the handle, the component preconditions and the borrow
     * state before touching storage, so a rejected call leaves the world unchanged.
     * Structural changes take an exclusive borrow on every archetype they touch and fail
     * with ComponentAlreadyBorrowed while a Ref, RefMut or QueryBorrow covers one of them.
     * All borrow handles must be released before the World is destroyed.
     */
    class World
    {
    public:
        struct Config
        {
            std::size_t initialEntityCapacity = config::INITIAL_ENTITY_CAPACITY;
            std::size_t initialArchetypeCapacity = 0;
        };

        World() : World(Config{}) {}

        explicit World(const Config& config) :
            m_entities(config.initialEntityCapacity)
        {
            m_archetypes.reserve(config.initialArchetypeCapacity + 1);
            m_archetypeIndex.reserve(config.initialArchetypeCapacity + 1);

            // The empty archetype always exists at index 0
            GetOrCreateArchetype(Signature{});
        }

        World(const World&) = delete;
        World& operator=(const World&) = delete;
        World(World&&) noexcept = default;
        World& operator=(World&&) noexcept = default;

        template<typename... Ts>
            requires StaticBundle<Ts...>
        Result<Entity, Error> Spawn(Ts&&... components)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("World::Spawn", Profile::ColorEntity);

            m_registry.RegisterAll<std::remove_cvref_t<Ts>...>();
            const std::uint32_t archetypeIndex = GetOrCreateArchetype(BundleSignature<Ts...>());
            Archetype& archetype = *m_archetypes[archetypeIndex];

            std::vector<ExclusiveBorrow> borrows;
            if (!archetype.TryLockExclusive(borrows)) STRATA_UNLIKELY
            {
                return Err(ErrorCode::ComponentAlreadyBorrowed);
            }

            return EmplaceRow(archetype, archetypeIndex, [&](std::uint32_t row)
            {
                (archetype.Construct(row, std::forward<Ts>(components)), ...);
            });
        }

        template<typename... Ts>
            requires StaticBundle<Ts...>
        Result<Entity, Error> Spawn(std::tuple<Ts...> bundle)
        {
            return std::apply([this](auto&... components)
            {
                return Spawn(std::move(components)...);
            }, bundle);
        }

        Result<Entity, Error> Spawn(BuiltEntity&& built)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("World::Spawn", Profile::ColorEntity);

            BuiltEntity bundle(std::move(built));
            RegisterEntries(bundle);
            const std::uint32_t archetypeIndex = GetOrCreateArchetype(bundle.GetSignature());
            Archetype& archetype = *m_archetypes[archetypeIndex];

            std::vector<ExclusiveBorrow> borrows;
            if (!archetype.TryLockExclusive(borrows)) STRATA_UNLIKELY
            {
                return Err(ErrorCode::ComponentAlreadyBorrowed);
            }

            return EmplaceRow(archetype, archetypeIndex, [&](std::uint32_t row)
            {
                for (const auto& entry : bundle.Entries())
                {
                    archetype.ConstructFrom(row, entry.descriptor.id, entry.data);
                }
            });
        }

        /**
         * Spawns `count` entities with the components Ts..., taking the values of the
         * i-th entity from generator(i), which must return std::tuple<Ts...>.
         * Storage for the whole batch is reserved up front. If the generator or a
         * constructor throws, every entity of the batch is dropped again before rethrowing.
         */
        template<typename... Ts, typename Generator>
            requires StaticBundle<Ts...>
        Result<std::vector<Entity>, Error> SpawnBatch(std::size_t count, Generator&& generator)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("World::SpawnBatch", Profile::ColorEntity);
            static_assert(std::is_same_v<std::invoke_result_t<Generator&, std::size_t>, std::tuple<Ts...>>,
                          "SpawnBatch generator must return std::tuple<Ts...>");

            m_registry.RegisterAll<Ts...>();
            const std::uint32_t archetypeIndex = GetOrCreateArchetype(BundleSignature<Ts...>());
            Archetype& archetype = *m_archetypes[archetypeIndex];

            std::vector<ExclusiveBorrow> borrows;
            if (!archetype.TryLockExclusive(borrows)) STRATA_UNLIKELY
            {
                return Err(ErrorCode::ComponentAlreadyBorrowed);
            }

            archetype.Reserve(count);
            m_entities.Reserve(m_entities.Size() + count);

            std::vector<Entity> spawned;
            spawned.reserve(count);
            try
            {
                for (std::size_t i = 0; i < count; ++i)
                {
                    std::tuple<Ts...> values = generator(i);
                    spawned.push_back(EmplaceRow(archetype, archetypeIndex, [&](std::uint32_t row)
                    {
                        std::apply([&archetype, row](auto&... components)
                        {
                            (archetype.Construct(row, std::move(components)), ...);
                        }, values);
                    }));
                }
            }
            catch (...)
            {
                // The batch occupies the last rows, so they are dropped newest first
                for (auto it = spawned.rbegin(); it != spawned.rend(); ++it)
                {
                    archetype.AbandonRow(m_entities.GetLocation(it->GetIndex()).row);
                    m_entities.Deallocate(*it);
                }
                throw;
            }
            return std::move(spawned);
        }

        Result<void, Error> Despawn(Entity entity)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("World::Despawn", Profile::ColorEntity);

            if (auto valid = m_entities.Validate(entity); !valid) STRATA_UNLIKELY
            {
                return valid;
            }

            const EntityLocation location = m_entities.GetLocation(entity.GetIndex());
            Archetype& archetype = *m_archetypes[location.archetype];

            std::vector<ExclusiveBorrow> borrows;
            if (!archetype.TryLockExclusive(borrows)) STRATA_UNLIKELY
            {
                return Err(ErrorCode::ComponentAlreadyBorrowed);
            }

            if (auto moved = archetype.SwapRemove(location.row))
            {
                m_entities.SetRow(moved->GetIndex(), location.row);
            }
            return m_entities.Free(entity);
        }

        /**
         * Adds the given components to an entity. Values for types the entity already has
         * replace the old ones; if no new type is added the row is updated in place.
         */
        template<typename... Ts>
            requires StaticBundle<Ts...>
        Result<void, Error> Insert(Entity entity, Ts&&... components)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("World::Insert", Profile::ColorComponent);

            if (auto valid = m_entities.Validate(entity); !valid) STRATA_UNLIKELY
            {
                return valid;
            }

            m_registry.RegisterAll<std::remove_cvref_t<Ts>...>();
            auto transition = PrepareInsert(entity, BundleSignature<Ts...>());
            if (!transition) STRATA_UNLIKELY
            {
                return Err(transition.Error());
            }

            Archetype& target = *transition->target;
            const std::uint32_t row = transition->row;
            if (transition->inPlace)
            {
                // Copies are made before any old value is dropped, so a throwing copy changes nothing
                std::tuple<std::remove_cvref_t<Ts>...> staged(std::forward<Ts>(components)...);
                std::apply([&target, row](auto&... values)
                {
                    (target.Overwrite(row, std::move(values)), ...);
                }, staged);
                return {};
            }

            try
            {
                (target.Construct(row, std::forward<Ts>(components)), ...);
            }
            catch (...)
            {
                target.AbandonRow(row);
                throw;
            }
            CompleteMigration(entity, *transition);
            return {};
        }

        template<typename... Ts>
            requires StaticBundle<Ts...>
        Result<void, Error> Insert(Entity entity, std::tuple<Ts...> bundle)
        {
            return std::apply([this, entity](auto&... components)
            {
                return Insert(entity, std::move(components)...);
            }, bundle);
        }

        Result<void, Error> Insert(Entity entity, BuiltEntity&& built)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("World::Insert", Profile::ColorComponent);

            BuiltEntity bundle(std::move(built));
            if (auto valid = m_entities.Validate(entity); !valid) STRATA_UNLIKELY
            {
                return valid;
            }

            RegisterEntries(bundle);
            auto transition = PrepareInsert(entity, bundle.GetSignature());
            if (!transition) STRATA_UNLIKELY
            {
                return Err(transition.Error());
            }

            Archetype& target = *transition->target;
            const std::uint32_t row = transition->row;
            if (transition->inPlace)
            {
                for (const auto& entry : bundle.Entries())
                {
                    target.Overwrite(row, entry.descriptor.id, entry.data);
                }
                return {};
            }

            try
            {
                for (const auto& entry : bundle.Entries())
                {
                    target.ConstructFrom(row, entry.descriptor.id, entry.data);
                }
            }
            catch (...)
            {
                target.AbandonRow(row);
                throw;
            }
            CompleteMigration(entity, *transition);
            return {};
        }

        template<typename T>
        Result<void, Error> InsertOne(Entity entity, T&& component)
        {
            return Insert(entity, std::forward<T>(component));
        }

        /**
         * Removes the components Ts... from an entity and hands their values back.
         * Fails with ComponentMissing, leaving the entity untouched, if any of them is absent.
         */
        template<typename... Ts>
            requires (sizeof...(Ts) > 0 && StaticBundle<Ts...>)
        Result<std::tuple<Ts...>, Error> Remove(Entity entity)
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("World::Remove", Profile::ColorComponent);
            static_assert((std::is_same_v<Ts, std::remove_cvref_t<Ts>> && ...), "Remove takes plain component types");

            if (auto valid = m_entities.Validate(entity); !valid) STRATA_UNLIKELY
            {
                return Err(valid.Error());
            }

            const EntityLocation location = m_entities.GetLocation(entity.GetIndex());
            if (!(m_archetypes[location.archetype]->Has<Ts>() && ...)) STRATA_UNLIKELY
            {
                return Err(ErrorCode::ComponentMissing);
            }

            const Signature removed = Signature::Of<Ts...>();
            const std::uint32_t targetIndex = GetOrCreateArchetype(m_archetypes[location.archetype]->GetSignature().Difference(removed));
            Archetype& source = *m_archetypes[location.archetype];
            Archetype& target = *m_archetypes[targetIndex];

            std::vector<ExclusiveBorrow> borrows;
            if (!source.TryLockExclusive(borrows) || !target.TryLockExclusive(borrows)) STRATA_UNLIKELY
            {
                return Err(ErrorCode::ComponentAlreadyBorrowed);
            }

            const std::uint32_t targetRow = target.AllocateRow(entity);
            std::tuple<Ts...> values{source.Take<Ts>(location.row)...};
            Relocate(entity, location, source, target, targetIndex, targetRow, removed);
            return std::move(values);
        }

        template<typename T>
        Result<T, Error> RemoveOne(Entity entity)
        {
            auto removed = Remove<T>(entity);
            if (!removed) STRATA_UNLIKELY
            {
                return Err(removed.Error());
            }
            return std::move(std::get<0>(*removed));
        }

        STRATA_NODISCARD Result<EntityRef, Error> GetEntity(Entity entity)
        {
            if (auto valid = m_entities.Validate(entity); !valid) STRATA_UNLIKELY
            {
                return Err(valid.Error());
            }

            const EntityLocation location = m_entities.GetLocation(entity.GetIndex());
            Archetype& archetype = *m_archetypes[location.archetype];

            auto borrow = SharedBorrow::TryAcquire(archetype.EntityBorrow());
            if (!borrow) STRATA_UNLIKELY
            {
                return Err(ErrorCode::ComponentAlreadyBorrowed);
            }
            return EntityRef(std::move(borrow), entity, archetype, location.row);
        }

        template<typename T>
        STRATA_NODISCARD Result<Ref<T>, Error> Get(Entity entity)
        {
            auto ref = GetEntity(entity);
            if (!ref) STRATA_UNLIKELY
            {
                return Err(ref.Error());
            }
            return ref->Get<T>();
        }

        template<typename T>
        STRATA_NODISCARD Result<RefMut<T>, Error> GetMut(Entity entity)
        {
            auto ref = GetEntity(entity);
            if (!ref) STRATA_UNLIKELY
            {
                return Err(ref.Error());
            }
            return ref->GetMut<T>();
        }

        template<typename T>
        STRATA_NODISCARD bool Has(Entity entity) const noexcept
        {
            if (!m_entities.Contains(entity))
                return false;
            return m_archetypes[m_entities.GetLocation(entity.GetIndex()).archetype]->Has<T>();
        }

        STRATA_NODISCARD bool Contains(Entity entity) const noexcept
        {
            return m_entities.Contains(entity);
        }

        // Archetype index and row currently holding the entity's values
        STRATA_NODISCARD Result<EntityLocation, Error> Locate(Entity entity) const
        {
            if (auto valid = m_entities.Validate(entity); !valid) STRATA_UNLIKELY
            {
                return Err(valid.Error());
            }
            return m_entities.GetLocation(entity.GetIndex());
        }

        /**
         * Borrows every archetype matching Args for as long as the returned QueryBorrow lives.
         * Matching is done fresh on each call.
         */
        template<typename... Args>
        STRATA_NODISCARD Result<QueryBorrow<Args...>, Error> Query()
        {
            return QueryBorrow<Args...>::Acquire(m_archetypes);
        }

        // Grows the archetype for Ts... so the next `additional` spawns into it do not reallocate
        template<typename... Ts>
            requires StaticBundle<Ts...>
        Result<void, Error> Reserve(std::size_t additional)
        {
            m_registry.RegisterAll<Ts...>();
            Archetype& archetype = *m_archetypes[GetOrCreateArchetype(BundleSignature<Ts...>())];

            std::vector<ExclusiveBorrow> borrows;
            if (!archetype.TryLockExclusive(borrows)) STRATA_UNLIKELY
            {
                return Err(ErrorCode::ComponentAlreadyBorrowed);
            }

            archetype.Reserve(additional);
            m_entities.Reserve(m_entities.Size() + additional);
            return {};
        }

        // Despawns every entity. Archetypes and their capacity are kept
        Result<void, Error> Clear()
        {
            STRATA_PROFILE_ZONE_NAMED_COLOR("World::Clear", Profile::ColorEntity);

            std::vector<ExclusiveBorrow> borrows;
            for (auto& archetype : m_archetypes)
            {
                if (!archetype->TryLockExclusive(borrows)) STRATA_UNLIKELY
                {
                    return Err(ErrorCode::ComponentAlreadyBorrowed);
                }
            }

            for (auto& archetype : m_archetypes)
            {
                archetype->Clear();
            }
            m_entities.Clear();
            return {};
        }

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_entities.Size(); }
        STRATA_NODISCARD bool IsEmpty() const noexcept { return m_entities.IsEmpty(); }
        STRATA_NODISCARD std::size_t ArchetypeCount() const noexcept { return m_archetypes.size(); }
        STRATA_NODISCARD const ComponentRegistry& GetComponentRegistry() const noexcept { return m_registry; }

    private:
        struct Transition
        {
            Archetype* source;
            Archetype* target;
            EntityLocation location;
            std::uint32_t targetIndex;
            std::uint32_t row;
            bool inPlace;
            Signature consumed;
            std::vector<ExclusiveBorrow> borrows;
        };

        std::uint32_t GetOrCreateArchetype(const Signature& signature)
        {
            auto it = m_archetypeIndex.find(signature);
            if (it != m_archetypeIndex.end()) STRATA_LIKELY
            {
                return it->second;
            }

            STRATA_PROFILE_ZONE_NAMED_COLOR("World::CreateArchetype", Profile::ColorMemory);
            const auto index = static_cast<std::uint32_t>(m_archetypes.size());
            m_archetypes.push_back(std::make_unique<Archetype>(signature, m_registry));
            m_archetypeIndex.emplace(signature, index);
            return index;
        }

        void RegisterEntries(const BuiltEntity& bundle)
        {
            for (const auto& entry : bundle.Entries())
            {
                m_registry.Register(entry.descriptor);
            }
        }

        /**
         * Appends a row to `archetype`, lets `fill` construct every cell of it, then hands
         * out the entity id. A throw from `fill` drops the cells built so far and the row,
         * and no id is consumed.
         */
        template<typename Fill>
        Entity EmplaceRow(Archetype& archetype, std::uint32_t archetypeIndex, Fill&& fill)
        {
            const std::uint32_t row = archetype.AllocateRow(Entity::Invalid());
            Entity entity;
            try
            {
                fill(row);
                entity = m_entities.Allocate();
            }
            catch (...)
            {
                archetype.AbandonRow(row);
                throw;
            }

            archetype.SetEntity(row, entity);
            m_entities.SetLocation(entity.GetIndex(), EntityLocation{archetypeIndex, row});
            return entity;
        }

        /**
         * Moves an entity from `source` into the already allocated `targetRow` of `target`.
         * Cells of `consumed` must already be dead in the source row.
         */
        void Relocate(Entity entity, EntityLocation location, Archetype& source, Archetype& target,
                      std::uint32_t targetIndex, std::uint32_t targetRow, const Signature& consumed)
        {
            if (auto moved = source.MigrateRow(location.row, target, targetRow, consumed))
            {
                m_entities.SetRow(moved->GetIndex(), location.row);
            }
            m_entities.SetLocation(entity.GetIndex(), EntityLocation{targetIndex, targetRow});
        }

        /**
         * Locks the archetypes an insert touches. When the signature grows, a row is
         * allocated in the target for the caller to fill with the added values; the source
         * row is left intact until CompleteMigration.
         */
        Result<Transition, Error> PrepareInsert(Entity entity, const Signature& added)
        {
            const EntityLocation location = m_entities.GetLocation(entity.GetIndex());
            const Signature targetSignature = m_archetypes[location.archetype]->GetSignature().Union(added);
            const std::uint32_t targetIndex = GetOrCreateArchetype(targetSignature);
            Archetype& source = *m_archetypes[location.archetype];
            Archetype& target = *m_archetypes[targetIndex];

            std::vector<ExclusiveBorrow> borrows;
            if (targetIndex == location.archetype)
            {
                if (!source.TryLockExclusive(borrows)) STRATA_UNLIKELY
                {
                    return Err(ErrorCode::ComponentAlreadyBorrowed);
                }
                return Transition{&source, &source, location, targetIndex, location.row, true, Signature{}, std::move(borrows)};
            }

            if (!source.TryLockExclusive(borrows) || !target.TryLockExclusive(borrows)) STRATA_UNLIKELY
            {
                return Err(ErrorCode::ComponentAlreadyBorrowed);
            }

            const std::uint32_t row = target.AllocateRow(entity);
            return Transition{&source, &target, location, targetIndex, row, false,
                              source.GetSignature().Intersection(added), std::move(borrows)};
        }

        // Drops the replaced values and moves the rest of the source row into the filled target row
        void CompleteMigration(Entity entity, const Transition& transition)
        {
            for (ComponentID id : transition.consumed)
            {
                transition.source->GetColumn(id)->DestroyAt(transition.location.row);
            }
            Relocate(entity, transition.location, *transition.source, *transition.target,
                     transition.targetIndex, transition.row, transition.consumed);
        }

        EntityAllocator m_entities;
        ComponentRegistry m_registry;
        std::vector<std::unique_ptr<Archetype>> m_archetypes;
        std::unordered_map<Signature, std::uint32_t, SignatureHash> m_archetypeIndex;
    };
}
