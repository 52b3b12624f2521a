// ============================================================================
// parmap/parmap.hpp - Main Include Header
// ============================================================================
//
// Includes the complete parmap library.
//
// USAGE:
// ------
//   #include <parmap/parmap.hpp>
//   using namespace parmap;
//
// ============================================================================

#pragma once

// Core
#include "parmap/core/check.hpp"
#include "parmap/core/defer.hpp"
#include "parmap/core/error.hpp"
#include "parmap/core/generator.hpp"
#include "parmap/core/outcome.hpp"

// Worker pool
#include "parmap/pool/thread_utils.hpp"
#include "parmap/pool/worker_pool.hpp"
#include "parmap/sync/completion_latch.hpp"

// Mapping
#include "parmap/map/accumulator.hpp"
#include "parmap/map/invocation.hpp"
#include "parmap/map/options.hpp"
#include "parmap/map/parallel_map.hpp"
#include "parmap/map/progress.hpp"
