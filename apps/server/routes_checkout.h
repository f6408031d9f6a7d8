#pragma once

#include "server_context.h"
#include "http_utils.h"
#include "request_builder.h"

#include "kitquote/bucket_optimizer.h"

#include <spdlog/spdlog.h>

#include <string>

inline void RegisterCheckoutRoutes(ServerContext& ctx) {
    // Quote -> checkout link
    ctx.server.Post(
        "/api/owners/:owner/checkout",
        [&ctx](const httplib::Request& req, httplib::Response& res) {
            AddCorsHeaders(req, res);
            const std::string owner = req.path_params.at("owner");

            CheckoutInput input;
            try {
                input = BuildCheckoutInput(ParseJsonBody(req));
            } catch (const InputError& e) {
                SetJsonResponse(res, json{{"ok", false}, {"error", e.what()}}, 400);
                return;
            }

            CheckoutOutcome outcome = ctx.assembler.AssembleCheckout(owner, input);
            if (!outcome.ok) {
                SetJsonResponse(res,
                                json{{"ok", false},
                                     {"error", outcome.error},
                                     {"code", ToErrorCodeString(outcome.code)}},
                                StatusForError(outcome.code));
                return;
            }
            SetJsonResponse(res,
                            json{{"ok", true}, {"data", CheckoutResultToJson(outcome.data)}});
        });

    // Stateless pack optimization
    ctx.server.Post("/api/optimize",
                    [](const httplib::Request& req, httplib::Response& res) {
                        AddCorsHeaders(req, res);
                        try {
                            OptimizeRequest opt = BuildOptimizeRequest(ParseJsonBody(req));
                            std::vector<PackCount> packs =
                                OptimizeBuckets(opt.volume, opt.variants, opt.policy);
                            json arr = json::array();
                            for (const PackCount& p : packs) {
                                arr.push_back({{"size", p.size}, {"quantity", p.quantity}});
                            }
                            json j = {
                                {"packs", arr},
                                {"total_size", TotalSize(packs)},
                                {"total_cost", TotalCost(packs, opt.variants)},
                            };
                            SetJsonResponse(res, j);
                        } catch (const InputError& e) {
                            SetJsonResponse(res, ErrorJson(e.what()), 400);
                        }
                    });
}
