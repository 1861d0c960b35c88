#pragma once
/**
 * @file psh_base.hpp
 * @brief Layer 1: Basic modules built on psh_platform.
 *
 * Provides format_tools, debug_info (panic, stack traces), scope_guard and the
 * Result type used for every fallible sharing operation.
 * Include this when you need formatting, debug utilities, or basic RAII guards.
 */
#include "psh_platform.hpp"

#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/chrono.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/result.hpp"
