#pragma once
/**
 * @file lp_service.hpp
 * @brief Layer 2: Service modules built on lp_base.
 *
 * Provides logging and the bounded subprocess runner used for external OS queries.
 */
#include "lp_base.hpp"

#include "utils/logger.hpp"
#include "utils/subprocess.hpp"
