#pragma once

// Strata - archetype entity-component storage
// Includes every public Strata header in dependency order

// Core
#include "Core/Platform.hpp"
#include "Core/Base.hpp"
#include "Core/Version.hpp"
#include "Core/Config.hpp"
#include "Core/Error.hpp"
#include "Core/Result.hpp"
#include "Core/Profile.hpp"
#include "Core/Memory.hpp"
#include "Core/TypeID.hpp"

// Entity handles
#include "Entity/Entity.hpp"
#include "Entity/EntityAllocator.hpp"

// Component types and signatures
#include "Component/Component.hpp"
#include "Component/ComponentRegistry.hpp"
#include "Component/Signature.hpp"
#include "Component/Bundle.hpp"

// Columnar storage
#include "Archetype/BorrowState.hpp"
#include "Archetype/Column.hpp"
#include "Archetype/Archetype.hpp"

// World and queries
#include "World/Ref.hpp"
#include "World/EntityBuilder.hpp"
#include "World/EntityRef.hpp"
#include "World/Query.hpp"
#include "World/World.hpp"
