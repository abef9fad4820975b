#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "umadb/client.hpp"

#include "common/cli/validators.hpp"
#include "common/logger.hpp"

namespace umadb::examples::cli::minimal {

struct Params {
    std::string url           = "http://127.0.0.1:50051";
    std::string ca_path;
    std::uint32_t batch_size  = 256;
    std::uint32_t timeout_ms  = 5000;
    std::string log_level     = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n  URL        : " << url << "\n";
        os << "  CA file    : " << (ca_path.empty() ? "(none)" : ca_path) << "\n";
        os << "  Batch size : " << batch_size << "\n";
        os << "  Timeout    : " << timeout_ms << " ms\n";
        os << "  Log Level  : " << log_level << "\n";
    }

    [[nodiscard]]
    inline client_config to_config() const {
        client_config cfg;
        cfg.url = url;
        if (!ca_path.empty()) {
            cfg.ca_path = ca_path;
        }
        cfg.batch_size = batch_size;
        cfg.connect_timeout = std::chrono::milliseconds(timeout_ms);
        return cfg;
    }
};

// Registers the connection options shared by every example
inline void add_connection_options(CLI::App& app, Params& params) {
    app.add_option("--url", params.url, "Store endpoint (http:// or https://)")->check(store_url_validator)->default_val(params.url);
    app.add_option("--ca-path", params.ca_path, "PEM file with trusted CA certificates (enables TLS)")->check(CLI::ExistingFile);
    app.add_option("--batch-size", params.batch_size, "Events per read round trip")->check(CLI::PositiveNumber)->default_val(params.batch_size);
    app.add_option("--timeout-ms", params.timeout_ms, "Connect timeout in milliseconds")->check(CLI::PositiveNumber)->default_val(params.timeout_ms);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);
}

// Parses argv, exiting on --help or invalid input, and applies the log level
inline void parse(CLI::App& app, int argc, char** argv, const Params& params) {
    app.footer(
        "This example talks to a running UmaDB store.\n"
        "Failures are reported as [code] message."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    set_log_level(params.log_level);
}

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};
    add_connection_options(app, params);
    parse(app, argc, argv, params);
    return params;
}

} // namespace umadb::examples::cli::minimal
