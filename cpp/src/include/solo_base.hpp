#pragma once
/**
 * @file solo_base.hpp
 * @brief Layer 1: Basic modules built on solo_platform.
 *
 * Provides format_tools, debug_info (SOLOHUB_PANIC / SOLOHUB_DEBUG, stack traces)
 * and the ScopeGuard RAII helper.
 * Include this when you need formatting, debug utilities, or scope-exit cleanup.
 */
#include "solo_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
