#include "server/server_options.h"
#include "server/server_context.h"
#include "server/http_utils.h"
#include "server/routes_health.h"
#include "server/routes_catalog.h"
#include "server/routes_checkout.h"

#include "kitquote/catalog_store.h"
#include "kitquote/checkout.h"
#include "kitquote/logging.h"
#include "kitquote/shopify_client.h"
#include "kitquote/version.h"

#include <spdlog/spdlog.h>

#include <chrono>

using namespace KitQuote;

int main(int argc, char** argv) {
    ServerOptions opts;
    if (!ParseArgs(argc, argv, opts)) { return 1; }

    InitLogging(ParseLogLevel(opts.log_level));

    spdlog::info("KitQuote Server v{}", KITQUOTE_VERSION_STRING);
    spdlog::info("Configuration: port={}, host={}, data={}, timeout={}s, max_body={}KB, "
                 "log_level={}",
                 opts.port, opts.host, opts.data_dir, opts.timeout_seconds, opts.max_body_kb,
                 opts.log_level);

    // Load operator catalogs
    spdlog::info("Loading catalogs from: {}", opts.data_dir);
    CatalogStore store;
    try {
        store.LoadFromDirectory(opts.data_dir);
    } catch (const Error& e) {
        spdlog::error("Failed to load catalogs: {}", e.what());
        return 1;
    }
    spdlog::info("Loaded {} catalog(s)", store.Size());

    // Create services
    ShopifyClientOptions client_opts;
    client_opts.read_timeout_seconds = opts.timeout_seconds;
    ShopifyClient client(client_opts);

    CheckoutAssembler assembler(store, client);

    // Create HTTP server and context
    httplib::Server svr;
    svr.set_payload_max_length(static_cast<size_t>(opts.max_body_kb) * 1024);

    ServerContext ctx{svr, opts, store, assembler};

    // Register routes
    RegisterHealthRoutes(ctx);
    RegisterCatalogRoutes(ctx);
    RegisterCheckoutRoutes(ctx);

    // CORS preflight
    svr.Options(R"(/api/.*)", [](const httplib::Request& req, httplib::Response& res) {
        AddCorsHeaders(req, res);
        res.status = 204;
    });

    // Error handler
    svr.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        AddCorsHeaders(req, res);
        json j = ErrorJson("Not found");
        if (res.status == 413) { j = ErrorJson("Payload too large"); }
        res.set_content(j.dump(), "application/json");
    });

    // Exception handler
    svr.set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            AddCorsHeaders(req, res);
            std::string msg = "Internal server error";
            try {
                if (ep) { std::rethrow_exception(ep); }
            } catch (const std::exception& e) { msg = e.what(); } catch (...) {
            }
            spdlog::error("Unhandled exception: {}", msg);
            res.set_content(ErrorJson(msg).dump(), "application/json");
            res.status = 500;
        });

    // Request logger (skip noisy health-check endpoint)
    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        if (req.path == "/api/health") { return; }
        auto elapsed = std::chrono::steady_clock::now() - req.start_time_;
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        spdlog::info("{} {} {} {} {}ms", req.remote_addr, req.method, req.path, res.status, ms);
    });

    spdlog::info("Starting server on {}:{}", opts.host, opts.port);
    if (!svr.listen(opts.host, opts.port)) {
        spdlog::error("Failed to start server on {}:{}", opts.host, opts.port);
        return 1;
    }

    return 0;
}
