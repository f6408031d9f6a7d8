#pragma once

#include <cstdio>
#include <cstdlib>
#include <string>

struct ServerOptions {
    int port         = 8080;
    std::string host = "0.0.0.0";
    std::string data_dir;          // Operator catalog directory (required)
    int timeout_seconds   = 30;    // Commerce platform read timeout
    int max_body_kb       = 256;
    std::string log_level = "info";
};

inline void PrintUsage(const char* exe) {
    std::printf(
        "Usage: %s --data <dir> [options]\n"
        "Options:\n"
        "  --port PORT          HTTP port (default: 8080)\n"
        "  --host HOST          Bind address (default: 0.0.0.0)\n"
        "  --data DIR           Operator catalog directory, one JSON per owner (required)\n"
        "  --timeout-s N        Commerce platform timeout in seconds (default: 30)\n"
        "  --max-body-kb N      Max request body in KB (default: 256)\n"
        "  --log-level LEVEL    Log level: trace/debug/info/warn/error/off (default: info)\n",
        exe);
}

inline bool ParseArgs(int argc, char** argv, ServerOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--port") && i + 1 < argc) {
            opts.port = std::stoi(argv[++i]);
        } else if ((arg == "--host") && i + 1 < argc) {
            opts.host = argv[++i];
        } else if ((arg == "--data") && i + 1 < argc) {
            opts.data_dir = argv[++i];
        } else if ((arg == "--timeout-s") && i + 1 < argc) {
            opts.timeout_seconds = std::stoi(argv[++i]);
        } else if ((arg == "--max-body-kb") && i + 1 < argc) {
            opts.max_body_kb = std::stoi(argv[++i]);
        } else if ((arg == "--log-level") && i + 1 < argc) {
            opts.log_level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return false;
        } else {
            std::fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            PrintUsage(argv[0]);
            return false;
        }
    }
    if (opts.data_dir.empty()) {
        std::fprintf(stderr, "Error: --data is required\n");
        PrintUsage(argv[0]);
        return false;
    }
    if (opts.timeout_seconds <= 0) {
        std::fprintf(stderr, "Error: --timeout-s must be > 0\n");
        return false;
    }
    return true;
}
