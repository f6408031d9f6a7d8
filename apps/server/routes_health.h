#pragma once

#include "server_context.h"
#include "http_utils.h"
#include "kitquote/version.h"

inline void RegisterHealthRoutes(ServerContext& ctx) {
    ctx.server.Get("/api/health",
                   [&ctx](const httplib::Request& req, httplib::Response& res) {
                       AddCorsHeaders(req, res);
                       json j = {
                           {"status", "ok"},
                           {"version", KITQUOTE_VERSION_STRING},
                           {"owners", ctx.store.Size()},
                       };
                       SetJsonResponse(res, j);
                   });
}
