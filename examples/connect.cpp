#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <thread>

#include "wirelink/core.hpp"

#include "common/cli/params.hpp"
#include "common/greeting.hpp"

namespace cli = wirelink::examples::cli;
using namespace wirelink::core;
using wirelink::examples::Greeting;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    std::signal(SIGINT, on_signal);

    // -------------------------------------------------------------
    // CLI parsing
    // -------------------------------------------------------------
    const auto params = cli::configure(argc, argv, "Wirelink - Connect Example\n"
        "Connects to a WebSocket echo server, sends a greeting as JSON and as CBOR,\n"
        "prints the echoed replies and keeps the session alive with liveness probes.\n"
    );
    params.dump("=== Connect Example Parameters ===", std::cout);

    // -------------------------------------------------------------
    // Session setup
    // -------------------------------------------------------------
    session::SessionT client{params.to_config()};

    if (auto err = client.connect()) {
        WL_ERROR("Connect failed: " << err);
        return -1;
    }

    // -------------------------------------------------------------
    // Send the same greeting in both wire formats
    // -------------------------------------------------------------
    const Greeting greeting{.type = "greeting", .content = "hi"};
    for (auto format : {codec::Format::Json, codec::Format::Cbor}) {
        if (auto err = client.send(greeting, format)) {
            WL_ERROR("Send (" << format << ") failed: " << err);
            return -1;
        }
        WL_INFO(" <- " << greeting << " as " << format);
    }

    // -------------------------------------------------------------
    // Echoed replies come back in the order they were sent
    // -------------------------------------------------------------
    std::atomic<int> replies{0};
    std::thread reader([&] {
        const codec::Format expected[] = {codec::Format::Json, codec::Format::Cbor};
        while (running.load()) {
            const codec::Format format = expected[replies.load() % 2];
            std::optional<Greeting> reply;
            if (auto err = client.receive(reply, format)) {
                if (err.code == session::ErrorCode::DecodeFailure) {
                    WL_WARN(" -> undecodable reply: " << err.message);
                    continue;
                }
                WL_INFO("Reader stopping: " << err);
                break;
            }
            if (reply) {
                ++replies;
                WL_INFO(" -> " << *reply << " (" << format << ")");
            }
        }
    });

    // -------------------------------------------------------------
    // Keep the session alive in the background
    // -------------------------------------------------------------
    if (auto err = client.maintain()) {
        WL_WARN("Liveness maintenance unavailable: " << err);
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(params.run_seconds);
    while (running.load() && std::chrono::steady_clock::now() < deadline) {
        if (client.state() == session::State::Terminated) {
            WL_ERROR("Session terminated: " << client.last_error());
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    running.store(false);
    client.disconnect();   // unblocks the reader
    reader.join();

    std::cout << "\n========== SUMMARY ==========\n";
    std::cout << "Replies received : " << replies.load() << "\n";
    std::cout << "Connections      : " << client.epoch() << "\n";
    client.telemetry().debug_dump(std::cout);
    std::cout << "=== Done ===\n";
    return replies.load() > 0 ? 0 : 1;
}
