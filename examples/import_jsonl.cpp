// ============================================================================
// JSON Lines import example
//
// Demonstrates:
// - Parsing events from a JSON Lines file with simdjson
// - Appending them in fixed-size atomic batches
//
// One event per line:
//   {"type":"OrderPlaced","data":"...","tags":["order:1"],"uuid":"..."}
// ============================================================================
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "simdjson.h"

#include "umadb.hpp"
#include "umadb/core/codec/json/event_parser.hpp"

#include "common/cli/minimal.hpp"


int main(int argc, char** argv) {
    using namespace umadb;
    using core::codec::json::Result;
    using core::codec::json::event_parser;
    namespace cli = examples::cli;

    CLI::App app{"UmaDB import example\nAppends the events of a JSON Lines file.\n"};
    cli::minimal::Params params{};
    cli::minimal::add_connection_options(app, params);
    std::string path;
    std::uint32_t chunk = 100;
    app.add_option("file", path, "JSON Lines file")->required()->check(CLI::ExistingFile);
    app.add_option("--chunk", chunk, "Events per append")->check(CLI::PositiveNumber)->default_val(chunk);
    cli::minimal::parse(app, argc, argv, params);

    std::ifstream in(path);
    if (!in) {
        std::cerr << "[umadb] Cannot open " << path << "\n";
        return -1;
    }

    Client client{params.to_config()};
    if (Error err = client.connect(); !err.ok()) {
        std::cerr << "[umadb] Failed to connect: " << err << "\n";
        return -1;
    }

    simdjson::dom::parser parser;
    std::vector<Event> pending;
    std::uint64_t imported = 0;
    std::uint64_t line_no = 0;

    auto flush = [&]() -> bool {
        if (pending.empty()) {
            return true;
        }
        const std::size_t count = pending.size();
        Position last = 0;
        if (Error err = client.append(std::move(pending), std::nullopt, last); !err.ok()) {
            std::cerr << "[umadb] append failed near line " << line_no << ": " << err << "\n";
            return false;
        }
        pending.clear();
        imported += count;
        std::cout << "[umadb] " << imported << " event(s) imported, last position " << last << "\n";
        return true;
    };

    std::string line;
    while (std::getline(in, line)) {
        ++line_no;
        Event e;
        const Result r = event_parser::parse_line(parser, line, e);
        if (r == Result::Ignored) {
            continue;
        }
        if (r != Result::Parsed) {
            std::cerr << "[umadb] line " << line_no << ": " << core::codec::json::to_string(r) << "\n";
            return -1;
        }
        pending.push_back(std::move(e));
        if (pending.size() >= chunk && !flush()) {
            return -1;
        }
    }
    if (!flush()) {
        return -1;
    }

    std::cout << "\n[umadb] Done.\n";
    return 0;
}
