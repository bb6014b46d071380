#include <gtest/gtest.h>
#include <cstdint>
#include <memory>
#include <string>

#include "Strata/World/World.hpp"
#include "../TestComponents.hpp"

using namespace Strata;
using namespace Strata::Test;

class EntityBuilderTest : public ::testing::Test
{
protected:
    std::unique_ptr<World> world;

    void SetUp() override
    {
        world = std::make_unique<World>();
        Tracked::Reset();
    }

    void TearDown() override
    {
        world.reset();
    }
};

TEST_F(EntityBuilderTest, CollectsComponents)
{
    EntityBuilder builder;
    EXPECT_TRUE(builder.IsEmpty());

    builder.Add(Position{1.0f, 2.0f}).Add(Name{"built"});
    EXPECT_EQ(builder.Size(), 2u);
    EXPECT_TRUE(builder.Has<Position>());
    EXPECT_TRUE(builder.Has<Name>());
    EXPECT_FALSE(builder.Has<Velocity>());
}

TEST_F(EntityBuilderTest, AddingSameTypeReplaces)
{
    EntityBuilder builder;
    builder.Add(Name{"first"}).Add(Name{"second"});
    EXPECT_EQ(builder.Size(), 1u);

    auto entity = world->Spawn(builder.Build());
    ASSERT_TRUE(entity);
    EXPECT_EQ((*world->Get<Name>(*entity))->value, "second");
}

TEST_F(EntityBuilderTest, BuildLeavesBuilderReusable)
{
    EntityBuilder builder;
    builder.Add(Position{1.0f, 1.0f});
    BuiltEntity built = builder.Build();

    EXPECT_TRUE(builder.IsEmpty());
    EXPECT_EQ(built.Size(), 1u);
    EXPECT_EQ(built.GetSignature(), Signature::Of<Position>());

    builder.Add(Velocity{2.0f, 2.0f});
    auto first = world->Spawn(std::move(built));
    auto second = world->Spawn(builder.Build());
    ASSERT_TRUE(first && second);

    EXPECT_TRUE(world->Has<Position>(*first));
    EXPECT_FALSE(world->Has<Velocity>(*first));
    EXPECT_TRUE(world->Has<Velocity>(*second));
    EXPECT_FALSE(world->Has<Position>(*second));
}

TEST_F(EntityBuilderTest, SpawnSharesArchetypeWithStaticBundle)
{
    auto fromStatic = world->Spawn(Position{}, Velocity{});
    ASSERT_TRUE(fromStatic);
    const std::size_t archetypes = world->ArchetypeCount();

    EntityBuilder builder;
    builder.Add(Velocity{5.0f, 5.0f}).Add(Position{6.0f, 6.0f});
    auto fromBuilder = world->Spawn(builder.Build());
    ASSERT_TRUE(fromBuilder);

    EXPECT_EQ(world->ArchetypeCount(), archetypes);
    EXPECT_EQ(world->Locate(*fromBuilder)->archetype, world->Locate(*fromStatic)->archetype);
    EXPECT_EQ((*world->Get<Position>(*fromBuilder))->x, 6.0f);
}

TEST_F(EntityBuilderTest, InsertBuiltEntity)
{
    auto entity = world->Spawn(Position{1.0f, 1.0f}, Name{"old"});
    ASSERT_TRUE(entity);

    EntityBuilder builder;
    builder.Add(Name{"new"}).Add(Health{7, 9});
    ASSERT_TRUE(world->Insert(*entity, builder.Build()).IsOk());

    EXPECT_EQ((*world->Get<Name>(*entity))->value, "new");
    EXPECT_EQ((*world->Get<Health>(*entity))->current, 7);
    EXPECT_EQ((*world->Get<Position>(*entity))->x, 1.0f);
}

TEST_F(EntityBuilderTest, InsertBuiltEntityInPlace)
{
    auto entity = world->Spawn(Health{1, 1});
    ASSERT_TRUE(entity);
    const std::size_t archetypes = world->ArchetypeCount();

    EntityBuilder builder;
    builder.Add(Health{2, 2});
    ASSERT_TRUE(world->Insert(*entity, builder.Build()).IsOk());

    EXPECT_EQ(world->ArchetypeCount(), archetypes);
    EXPECT_EQ((*world->Get<Health>(*entity))->current, 2);
}

TEST_F(EntityBuilderTest, MoveOnlyComponents)
{
    EntityBuilder builder;
    builder.Add(Resource{11});
    auto entity = world->Spawn(builder.Build());
    ASSERT_TRUE(entity);

    auto resource = world->Get<Resource>(*entity);
    ASSERT_TRUE(resource);
    ASSERT_TRUE((*resource)->data);
    EXPECT_EQ(*(*resource)->data, 11);
}

TEST_F(EntityBuilderTest, OverAlignedValues)
{
    EntityBuilder builder;
    builder.Add(RenderData{3});
    auto entity = world->Spawn(builder.Build());
    ASSERT_TRUE(entity);

    auto render = world->Get<RenderData>(*entity);
    ASSERT_TRUE(render);
    EXPECT_EQ(reinterpret_cast<std::uintptr_t>(&render->Get()) % alignof(RenderData), 0u);
    EXPECT_EQ((*render)->textureId, 3);
}

TEST_F(EntityBuilderTest, DestroysEveryValue)
{
    {
        EntityBuilder builder;
        builder.Add(Tracked{1});
        builder.Add(Tracked{2});
        EXPECT_EQ(Tracked::Alive(), 1);

        // Never built
        EntityBuilder discarded;
        discarded.Add(Tracked{3});
        discarded.Clear();
        EXPECT_EQ(Tracked::Alive(), 1);

        BuiltEntity unused = builder.Build();
        EXPECT_EQ(Tracked::Alive(), 1);
    }
    EXPECT_EQ(Tracked::Alive(), 0);

    {
        EntityBuilder builder;
        builder.Add(Tracked{4});
        auto entity = world->Spawn(builder.Build());
        ASSERT_TRUE(entity);
        EXPECT_EQ(Tracked::Alive(), 1);
        EXPECT_EQ((*world->Get<Tracked>(*entity))->value, 4);
    }

    world.reset();
    EXPECT_EQ(Tracked::Alive(), 0);
}

TEST_F(EntityBuilderTest, RejectedSpawnDropsBundle)
{
    auto existing = world->Spawn(Position{}, Tracked{1});
    ASSERT_TRUE(existing);
    EXPECT_EQ(Tracked::Alive(), 1);

    {
        auto held = world->Get<Position>(*existing);
        ASSERT_TRUE(held);

        EntityBuilder builder;
        builder.Add(Tracked{2}).Add(Position{});
        auto result = world->Spawn(builder.Build());
        ASSERT_TRUE(result.IsErr());
        EXPECT_EQ(result.Error().code, ErrorCode::ComponentAlreadyBorrowed);
    }

    EXPECT_EQ(Tracked::Alive(), 1);
    EXPECT_EQ(world->Size(), 1u);
}
