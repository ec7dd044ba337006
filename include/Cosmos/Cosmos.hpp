#pragma once

// Cosmos - persisted single-world ECS registry
// This header includes all Cosmos headers in dependency order

// Core
#include "Core/Platform.hpp"
#include "Core/Base.hpp"
#include "Core/Version.hpp"
#include "Core/Config.hpp"
#include "Core/Hash.hpp"
#include "Core/Error.hpp"
#include "Core/Result.hpp"
#include "Core/Log.hpp"
#include "Core/Profile.hpp"

// Value types
#include "Container/Bitmap.hpp"
#include "Address/Address.hpp"

// Component bit allocation
#include "Registry/BitAllocator.hpp"
#include "Registry/ComponentRegister.hpp"

// World aggregate
#include "World/Entity.hpp"
#include "World/World.hpp"

// Persistence
#include "Serialization/SerializationError.hpp"
#include "Serialization/BinaryArchive.hpp"
#include "Serialization/BinaryWriter.hpp"
#include "Serialization/BinaryReader.hpp"
#include "Storage/Store.hpp"
#include "Storage/MemoryStore.hpp"
#include "Storage/FileStore.hpp"
#include "Storage/Transaction.hpp"
#include "Storage/Records.hpp"

// Entry points
#include "Ledger/WorldLedger.hpp"
