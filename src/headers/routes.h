#pragma once
/**
 * TexFill — Route registration
 */

#include <httplib.h>

#include "common.h"
#include "config.h"
#include "model_client.h"

// CORS headers on every response and a 204 answer to OPTIONS preflights.
void register_cors(httplib::Server& svr);

// /health, /test-model, /engines, /validate-latex, /upload-tex, /generate-pdf.
// `cfg` and `model` must outlive the server.
void register_latex_routes(httplib::Server& svr, const AppConfig& cfg, ModelClient& model);

// GET /api/stats
void register_stats_routes(httplib::Server& svr);
