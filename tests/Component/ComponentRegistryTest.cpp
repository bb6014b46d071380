#include <gtest/gtest.h>
#include <new>
#include <string>

#include "Strata/Component/ComponentRegistry.hpp"
#include "../TestComponents.hpp"

using namespace Strata;
using namespace Strata::Test;

class ComponentRegistryTest : public ::testing::Test
{
protected:
    ComponentRegistry registry;
};

TEST_F(ComponentRegistryTest, DescribesRegisteredTypes)
{
    const ComponentDescriptor& position = registry.Register<Position>();

    EXPECT_EQ(position.id, TypeID<Position>::Value());
    EXPECT_EQ(position.size, sizeof(Position));
    EXPECT_EQ(position.alignment, alignof(Position));
    EXPECT_TRUE(position.is_trivially_copyable);
    EXPECT_NE(position.name.find("Position"), std::string_view::npos);

    const ComponentDescriptor& name = registry.Register<Name>();
    EXPECT_FALSE(name.is_trivially_copyable);

    const ComponentDescriptor& render = registry.Register<RenderData>();
    EXPECT_EQ(render.alignment, 32u);
}

TEST_F(ComponentRegistryTest, RegistrationIsIdempotent)
{
    registry.RegisterAll<Position, Velocity>();
    registry.RegisterAll<Velocity, Position, Health>();

    EXPECT_EQ(registry.Size(), 3u);
    EXPECT_TRUE(registry.Contains(TypeID<Health>::Value()));
    EXPECT_EQ(registry.Get(TypeID<Player>::Value()), nullptr);
}

TEST_F(ComponentRegistryTest, RegistersTypeErasedDescriptors)
{
    ComponentDescriptor descriptor = ComponentDescriptor::Of<Name>();
    registry.Register(descriptor);

    const ComponentDescriptor* stored = registry.Get(TypeID<Name>::Value());
    ASSERT_NE(stored, nullptr);
    EXPECT_EQ(stored->size, sizeof(Name));
}

TEST_F(ComponentRegistryTest, DescriptorRelocatesValues)
{
    const ComponentDescriptor& desc = registry.Register<Name>();

    alignas(Name) unsigned char source[sizeof(Name)];
    alignas(Name) unsigned char target[sizeof(Name)];
    ::new (source) Name("relocated");

    desc.Relocate(target, source);

    Name* moved = std::launder(reinterpret_cast<Name*>(target));
    EXPECT_EQ(moved->value, "relocated");
    desc.Destruct(moved);
}
