#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <vector>

#include "Strata/Archetype/Archetype.hpp"
#include "Strata/Core/Config.hpp"
#include "../TestComponents.hpp"

using namespace Strata;
using namespace Strata::Test;

class ArchetypeTest : public ::testing::Test
{
protected:
    ComponentRegistry registry;

    void SetUp() override
    {
        registry.RegisterAll<Position, Velocity, Name, Tracked>();
        Tracked::Reset();
    }

    std::uint32_t AddRow(Archetype& archetype, Entity entity, float x, const char* name)
    {
        const std::uint32_t row = archetype.AllocateRow(entity);
        archetype.Construct(row, Position{x, x});
        archetype.Construct(row, Name{name});
        return row;
    }
};

TEST_F(ArchetypeTest, ColumnsFollowSignatureOrder)
{
    Archetype archetype(Signature::Of<Name, Position>(), registry);

    ASSERT_EQ(archetype.ColumnCount(), 2u);
    const Signature& signature = archetype.GetSignature();
    EXPECT_EQ(archetype.ColumnAt(0).GetID(), signature[0]);
    EXPECT_EQ(archetype.ColumnAt(1).GetID(), signature[1]);
    EXPECT_TRUE(archetype.Has<Position>());
    EXPECT_FALSE(archetype.Has<Velocity>());
    EXPECT_EQ(archetype.GetColumn(TypeID<Velocity>::Value()), nullptr);
}

TEST_F(ArchetypeTest, FirstAllocationReservesInitialCapacity)
{
    Archetype archetype(Signature::Of<Position, Name>(), registry);
    EXPECT_EQ(archetype.Capacity(), 0u);

    AddRow(archetype, Entity(0, 0), 1.0f, "a");
    EXPECT_EQ(archetype.Capacity(), config::INITIAL_ARCHETYPE_CAPACITY);

    for (std::uint32_t i = 1; i <= config::INITIAL_ARCHETYPE_CAPACITY; ++i)
    {
        AddRow(archetype, Entity(i, 0), float(i), "x");
    }
    EXPECT_EQ(archetype.Capacity(), config::INITIAL_ARCHETYPE_CAPACITY * config::GROWTH_FACTOR);
    EXPECT_EQ(archetype.Get<Position>(0).x, 1.0f);
    EXPECT_EQ(archetype.Get<Name>(0).value, "a");
}

TEST_F(ArchetypeTest, SwapRemoveReportsRelocatedEntity)
{
    Archetype archetype(Signature::Of<Position, Name>(), registry);
    AddRow(archetype, Entity(0, 0), 0.0f, "zero");
    AddRow(archetype, Entity(1, 0), 1.0f, "one");
    AddRow(archetype, Entity(2, 0), 2.0f, "two");

    std::optional<Entity> moved = archetype.SwapRemove(0);
    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(*moved, Entity(2, 0));
    EXPECT_EQ(archetype.Size(), 2u);
    EXPECT_EQ(archetype.GetEntity(0), Entity(2, 0));
    EXPECT_EQ(archetype.Get<Name>(0).value, "two");
    EXPECT_EQ(archetype.Get<Position>(0).x, 2.0f);

    // Removing the last row relocates nothing
    EXPECT_FALSE(archetype.SwapRemove(1).has_value());
    EXPECT_EQ(archetype.Size(), 1u);
}

TEST_F(ArchetypeTest, MigrateRowMovesSharedColumns)
{
    Archetype source(Signature::Of<Position, Name>(), registry);
    Archetype target(Signature::Of<Position, Velocity>(), registry);

    AddRow(source, Entity(0, 0), 5.0f, "migrating");
    AddRow(source, Entity(1, 0), 6.0f, "staying");

    const std::uint32_t targetRow = target.AllocateRow(Entity(0, 0));
    std::optional<Entity> moved = source.MigrateRow(0, target, targetRow, Signature{});
    target.Construct(targetRow, Velocity{1.0f, 1.0f});

    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(*moved, Entity(1, 0));
    EXPECT_EQ(source.Size(), 1u);
    EXPECT_EQ(source.Get<Name>(0).value, "staying");

    ASSERT_EQ(target.Size(), 1u);
    EXPECT_EQ(target.Get<Position>(targetRow).x, 5.0f);
    EXPECT_EQ(target.Get<Velocity>(targetRow).dx, 1.0f);
}

TEST_F(ArchetypeTest, MigrateRowSkipsConsumedCells)
{
    Archetype source(Signature::Of<Position, Tracked>(), registry);
    Archetype target(Signature::Of<Position>(), registry);

    const std::uint32_t row = source.AllocateRow(Entity(0, 0));
    source.Construct(row, Position{1.0f, 2.0f});
    source.Construct(row, Tracked{7});

    Tracked taken = source.Take<Tracked>(row);
    EXPECT_EQ(taken.value, 7);

    const std::uint32_t targetRow = target.AllocateRow(Entity(0, 0));
    source.MigrateRow(row, target, targetRow, Signature::Of<Tracked>());

    EXPECT_TRUE(source.IsEmpty());
    EXPECT_EQ(target.Get<Position>(targetRow).y, 2.0f);
    EXPECT_EQ(Tracked::Alive(), 1);
}

TEST_F(ArchetypeTest, ClearAndDestructionDropValues)
{
    {
        Archetype archetype(Signature::Of<Tracked>(), registry);
        for (std::uint32_t i = 0; i < 10; ++i)
        {
            const std::uint32_t row = archetype.AllocateRow(Entity(i, 0));
            archetype.Construct(row, Tracked{int(i)});
        }
        EXPECT_EQ(Tracked::Alive(), 10);

        const std::size_t capacity = archetype.Capacity();
        archetype.Clear();
        EXPECT_EQ(Tracked::Alive(), 0);
        EXPECT_EQ(archetype.Capacity(), capacity);

        const std::uint32_t row = archetype.AllocateRow(Entity(0, 1));
        archetype.Construct(row, Tracked{1});
    }
    EXPECT_EQ(Tracked::Alive(), 0);
}

TEST_F(ArchetypeTest, AbandonRowDropsPartiallyFilledRow)
{
    Tracked::Reset();
    {
        Archetype archetype(Signature::Of<Position, Tracked>(), registry);
        const std::uint32_t first = archetype.AllocateRow(Entity(0, 0));
        archetype.Construct(first, Position{1.0f, 1.0f});
        archetype.Construct(first, Tracked{1});

        // Second row gets only one of its two cells before it is given up
        const std::uint32_t second = archetype.AllocateRow(Entity::Invalid());
        archetype.Construct(second, Tracked{2});
        EXPECT_EQ(Tracked::Alive(), 2);

        archetype.AbandonRow(second);
        EXPECT_EQ(archetype.Size(), 1u);
        EXPECT_EQ(Tracked::Alive(), 1);
        EXPECT_EQ(archetype.GetColumn(TypeID<Position>::Value())->Size(), 1u);
        EXPECT_EQ(archetype.GetColumn(TypeID<Tracked>::Value())->Size(), 1u);

        // The next row lines up with the surviving columns again
        const std::uint32_t third = archetype.AllocateRow(Entity::Invalid());
        archetype.Construct(third, Position{3.0f, 3.0f});
        archetype.Construct(third, Tracked{3});
        archetype.SetEntity(third, Entity(2, 0));
        EXPECT_EQ(third, 1u);
        EXPECT_EQ(archetype.GetEntity(1), Entity(2, 0));
        EXPECT_EQ(archetype.Get<Tracked>(1).value, 3);
        EXPECT_EQ(archetype.Get<Position>(1).x, 3.0f);
    }
    EXPECT_EQ(Tracked::Alive(), 0);
}

TEST_F(ArchetypeTest, StructuralLockIsAllOrNothing)
{
    Archetype archetype(Signature::Of<Position, Velocity>(), registry);
    auto held = SharedBorrow::TryAcquire(archetype.GetColumn(TypeID<Velocity>::Value())->Borrow());
    ASSERT_TRUE(held);

    std::vector<ExclusiveBorrow> borrows;
    EXPECT_FALSE(archetype.TryLockExclusive(borrows));
    EXPECT_TRUE(borrows.empty());
    EXPECT_TRUE(archetype.EntityBorrow().IsFree());
    EXPECT_TRUE(archetype.GetColumn(TypeID<Position>::Value())->Borrow().IsFree());

    held.Release();
    EXPECT_TRUE(archetype.TryLockExclusive(borrows));
    EXPECT_EQ(borrows.size(), 3u);
}
