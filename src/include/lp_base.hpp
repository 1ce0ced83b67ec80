#pragma once
/**
 * @file lp_base.hpp
 * @brief Layer 1: Basic modules built on lp_platform.
 *
 * Provides format_tools, the generic Result<T, E> type and scope_guard.
 * Include this when you need formatting helpers or basic RAII guards.
 */
#include "lp_platform.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/chrono.h>

#include "utils/format_tools.hpp"
#include "utils/result.hpp"
#include "utils/scope_guard.hpp"
