// include/vector_knowledge_cache.hpp

#pragma once
#include "../src/core/vector.hpp"
#include "../src/core/vector_entry.hpp"
#include "../src/core/scope_key.hpp"
#include "../src/core/cache_config.hpp"
#include "../src/core/cache_errors.hpp"
#include "../src/core/vector_cache_store.hpp"
#include "../src/features/memory_budget_manager.hpp"
#include "../src/features/eviction_manager.hpp"
#include "../src/features/integrity_checker.hpp"
#include "../src/features/cache_stats.hpp"
#include "../src/features/cache_lifecycle_controller.hpp"
#include "../src/algorithms/similarity_search_engine.hpp"
#include "../src/api/external_interfaces.hpp"
#include "../src/api/cache_registry.hpp"
