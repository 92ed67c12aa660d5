// ============================================================================
// colock/colock.hpp - Main Include Header
// ============================================================================
//
// Pulls in the locks together with the host runtime they are used with.
// LibuvExecutor is not included here; include "colock/io/libuv_executor.hpp"
// directly when the library was built with libuv.
//
// USAGE:
// ------
//   #include <colock/colock.hpp>
//   using namespace colock;
//
// ============================================================================

#pragma once

// Core
#include "colock/core/check.hpp"
#include "colock/core/error.hpp"
#include "colock/core/result.hpp"
#include "colock/core/spawn.hpp"
#include "colock/core/task.hpp"
#include "colock/core/waker.hpp"

// Executors
#include "colock/io/executor.hpp"
#include "colock/io/manual_executor.hpp"
#include "colock/io/thread_pool_executor.hpp"

// Locks
#include "colock/sync/lock_guard.hpp"
#include "colock/sync/lock_status.hpp"
#include "colock/sync/mutex.hpp"
#include "colock/sync/rwlock.hpp"
#include "colock/sync/sync_wait.hpp"
