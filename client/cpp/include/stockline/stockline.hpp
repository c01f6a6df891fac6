#pragma once

/**
 * Stockline C++ Client Library
 *
 * Main include file - includes all public headers.
 */

// Error types
#include "errors.hpp"

// Helper utilities
#include "helpers.hpp"
#include "logging.hpp"
#include "validation.hpp"
#include "config.hpp"

// Vocabulary and storage
#include "types.hpp"
#include "durable_store.hpp"
#include "storage_health.hpp"

// Local state
#include "entity_cache.hpp"
#include "stock_ledger.hpp"
#include "operation_log.hpp"

// Remote store
#include "remote_store.hpp"
#include "client.hpp"

// Write path and sync
#include "compensation.hpp"
#include "writer.hpp"
#include "sync_processor.hpp"
#include "conflict_resolver.hpp"
#include "orchestrator.hpp"
#include "notification_sink.hpp"
#include "data_guard.hpp"

// Background work
#include "connectivity.hpp"
#include "coalescer.hpp"
#include "realtime.hpp"
#include "scheduler.hpp"

// Facade
#include "inventory_client.hpp"
