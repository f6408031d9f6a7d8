#pragma once

#include "server_context.h"
#include "http_utils.h"
#include "request_builder.h"

#include "kitquote/role_resolver.h"

#include <spdlog/spdlog.h>

#include <string>

inline void RegisterCatalogRoutes(ServerContext& ctx) {
    // Kit builders of one operator, with the role mapping each one resolves to
    ctx.server.Get("/api/owners/:owner/kit-builders",
                   [&ctx](const httplib::Request& req, httplib::Response& res) {
                       AddCorsHeaders(req, res);
                       const std::string owner = req.path_params.at("owner");
                       json kits               = json::array();
                       for (const KitBuilderConfig& kit : ctx.store.ListKitBuilders(owner)) {
                           kits.push_back(KitBuilderToJson(kit));
                       }
                       SetJsonResponse(res, json{{"kit_builders", kits}});
                   });

    // Bill of materials for an area, priced from the operator catalog
    ctx.server.Post(
        "/api/owners/:owner/breakdown",
        [&ctx](const httplib::Request& req, httplib::Response& res) {
            AddCorsHeaders(req, res);
            const std::string owner = req.path_params.at("owner");
            try {
                json params                = ParseJsonBody(req);
                std::optional<double> area = ParseArea(params);
                if (!area) { throw InputError("Missing required field: area_m2"); }
                const std::string kit_key = GetOptionalString(params, "kit_key");

                std::vector<CatalogProduct> products = ctx.store.ListProducts(owner);
                if (products.empty()) {
                    throw ConfigError("No product pricing configured for " + owner);
                }
                std::optional<KitBuilderConfig> kit = ctx.store.FindKitBuilder(owner, kit_key);
                if (!kit && !kit_key.empty()) {
                    throw InputError("Unknown kit builder: " + kit_key);
                }

                RoleResolver resolver(std::move(products),
                                      kit ? kit->BuildRoleMapping() : RoleMapping{});
                Breakdown breakdown =
                    ComputeBreakdown(*area, resolver.BuildVariantTable(),
                                     kit ? kit->BuildCoverageOverrides() : CoverageOverrides{},
                                     ctx.assembler.options().optimizer);
                SetJsonResponse(res, BreakdownToJson(breakdown, resolver));
            } catch (const Error& e) {
                SetJsonResponse(res, ErrorJson(e.what()), StatusForError(e.code()));
            }
        });

    // Reload every operator catalog from the data directory
    ctx.server.Post("/api/admin/reload",
                    [&ctx](const httplib::Request& req, httplib::Response& res) {
                        AddCorsHeaders(req, res);
                        try {
                            std::size_t n = ctx.store.ReloadFromDirectory(ctx.options.data_dir);
                            spdlog::info("Reloaded {} catalog(s) from {}", n,
                                         ctx.options.data_dir);
                            SetJsonResponse(res, json{{"owners", n}});
                        } catch (const IOError& e) {
                            SetJsonResponse(res, ErrorJson(e.what()), 500);
                        }
                    });
}
