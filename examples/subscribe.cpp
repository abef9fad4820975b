// ============================================================================
// Subscribe example
//
// Demonstrates:
// - Catching up on history, then following new events live
// - Cancelling a blocked stream from another thread
// - Clean shutdown via Ctrl+C
// ============================================================================
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "umadb.hpp"

#include "common/cli/minimal.hpp"


// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}


int main(int argc, char** argv) {
    using namespace umadb;
    namespace cli = examples::cli;

    CLI::App app{"UmaDB subscribe example\nFollows the events carrying a tag until Ctrl+C.\n"};
    cli::minimal::Params params{};
    cli::minimal::add_connection_options(app, params);
    std::vector<std::string> tags;
    app.add_option("-t,--tag", tags, "Tag every event must carry (repeatable)")->check(cli::tag_validator);
    cli::minimal::parse(app, argc, argv, params);

    std::signal(SIGINT, on_signal);  // Handle Ctrl+C

    Client client{params.to_config()};
    if (Error err = client.connect(); !err.ok()) {
        std::cerr << "[umadb] Failed to connect: " << err << "\n";
        return -1;
    }

    std::optional<Query> query;
    if (!tags.empty()) {
        query = Query{{QueryItem{{}, tags}}};
    }

    ReadStream stream;
    if (Error err = client.read(query, std::nullopt, false, std::nullopt, true, stream); !err.ok()) {
        std::cerr << "[umadb] subscribe failed: " << err << "\n";
        return -1;
    }

    // next() blocks while waiting for new events; the watcher ends it
    std::thread watcher([&stream] {
        while (running.load(std::memory_order_relaxed)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        stream.cancel();
    });

    SequencedEvent e;
    while (stream.next(e)) {
        std::cout << " -> " << e << std::endl;
    }

    running.store(false);
    watcher.join();

    if (!stream.cancelled() && !stream.error().ok()) {
        std::cerr << "[umadb] subscription failed: " << stream.error() << "\n";
        return -1;
    }

    std::cout << "\n[umadb] " << stream.delivered() << " event(s) received.\n";
    return 0;
}
