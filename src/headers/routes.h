#pragma once
/**
 * Handfont — Route registration
 */

#include "common.h"
#include "config.h"
#include "jobs.h"
#include "stats.h"

void register_page_routes(httplib::Server& svr, const ServerConfig& cfg);
void register_font_routes(httplib::Server& svr, FontJobService& jobs, StatsLedger& ledger);
void register_stats_routes(httplib::Server& svr, const ServerConfig& cfg, const StatsLedger& ledger);

// Limits, timeouts, error pages and all routes.
void configure_server(httplib::Server& svr, FontJobService& jobs, StatsLedger& ledger);
