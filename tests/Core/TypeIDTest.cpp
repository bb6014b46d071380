#include <gtest/gtest.h>
#include <set>
#include <string_view>

#include "Strata/Core/TypeID.hpp"

namespace
{
    struct Position { float x, y; };
    struct Velocity { float dx, dy; };

    namespace Game
    {
        struct Player { int id; };
    }
}

class TypeIDTest : public ::testing::Test
{
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(TypeIDTest, IdsAreUniquePerType)
{
    using namespace Strata;

    const auto posId = TypeID<Position>::Value();
    const auto velId = TypeID<Velocity>::Value();
    const auto playerId = TypeID<Game::Player>::Value();

    std::set<ComponentID> ids{posId, velId, playerId};
    EXPECT_EQ(ids.size(), 3u);

    EXPECT_EQ(TypeID<Position>::Value(), posId);
    EXPECT_NE(posId, INVALID_COMPONENT);
}

TEST_F(TypeIDTest, QualifiersShareTheDecayedId)
{
    using namespace Strata;

    EXPECT_EQ(TypeID<const Position>::Value(), TypeID<Position>::Value());
    EXPECT_EQ(TypeID<Position&>::Value(), TypeID<Position>::Value());
    EXPECT_EQ(TypeID<const Position&>::Value(), TypeID<Position>::Value());
}

TEST_F(TypeIDTest, NamesContainTheTypeName)
{
    using namespace Strata;

    constexpr std::string_view posName = TypeID<Position>::Name();
    constexpr std::string_view playerName = TypeID<Game::Player>::Name();

    EXPECT_NE(posName.find("Position"), std::string_view::npos) << "Position name: " << posName;
    EXPECT_NE(playerName.find("Game::Player"), std::string_view::npos) << "Player name: " << playerName;
    EXPECT_NE(posName, TypeID<Velocity>::Name());
}
