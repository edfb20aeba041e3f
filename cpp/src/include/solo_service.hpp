#pragma once
/**
 * @file solo_service.hpp
 * @brief Layer 2: Service modules built on solo_base.
 *
 * Provides the asynchronous Logger, the Result type, backoff strategies for spin
 * and retry loops, and the cross-process SharedSpinLock.
 * Include this when you need logging, Result-based error returns, or locking
 * inside shared memory.
 */
#include "solo_base.hpp"

#include "utils/backoff_strategy.hpp"
#include "utils/logger.hpp"
#include "utils/result.hpp"
#include "utils/shared_memory_spinlock.hpp"
