#pragma once
/**
 * @file lp_health.hpp
 * @brief Layer 3: Health diagnostics built on lp_service.
 *
 * Process lister, ownership classifier, health reporter, configuration loaders and the
 * diagnostic runner that ties them into one report.
 */
#include "lp_service.hpp"

#include "health/dependency_probe.hpp"
#include "health/diagnostic_report.hpp"
#include "health/diagnostic_runner.hpp"
#include "health/executable_finder.hpp"
#include "health/health_reporter.hpp"
#include "health/health_verdict.hpp"
#include "health/listener_record.hpp"
#include "health/ownership.hpp"
#include "health/package_spec.hpp"
#include "health/preview_config.hpp"
#include "health/preview_server.hpp"
#include "health/process_lister.hpp"
#include "health/version_range.hpp"
