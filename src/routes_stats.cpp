/**
 * TexFill — Stats route handlers
 */

#include "routes.h"
#include "stats.h"

void register_stats_routes(httplib::Server& svr) {

    // ── GET /api/stats?days=N&kind=extract|generate ─────────────────────────
    svr.Get("/api/stats", [](const httplib::Request& req, httplib::Response& res) {
        int days = 7;
        if (req.has_param("days")) {
            try {
                days = std::max(1, std::min(365, std::stoi(req.get_param_value("days"))));
            } catch (const std::logic_error&) {
                res.status = 400;
                res.set_content(R"({"error":"days must be a number"})", "application/json");
                return;
            }
        }

        string kind = req.has_param("kind") ? req.get_param_value("kind") : "";
        int64_t to_unix = stat_now();

        json resp;
        resp["days"] = days;

        if (kind.empty()) {
            resp["extract"]  = stat_summary_to_json(stat_query(stat_days_ago(days), to_unix, "extract"));
            resp["generate"] = stat_summary_to_json(stat_query(stat_days_ago(days), to_unix, "generate"));
        } else {
            resp[kind] = stat_summary_to_json(stat_query(stat_days_ago(days), to_unix, kind));
        }

        res.set_content(resp.dump(), "application/json");
    });
}
