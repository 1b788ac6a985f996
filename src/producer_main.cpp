// shmkv-producer: creates the store, seeds it and owns its removal.
#include <chrono>
#include <csignal>
#include <iostream>
#include <utility>
#include <string>
#include <thread>
#include <vector>

#include "shmkv/config.hpp"
#include "shmkv/errors.hpp"
#include "shmkv/kvstore.hpp"
#include "shmkv/log.hpp"
#include "shmkv/segment.hpp"

using namespace shmkv;

namespace {
volatile std::sig_atomic_t running = 1;

void HandleSignal(int) {
    running = 0;
}
} // namespace

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config.json]\n";
        return 1;
    }

    std::string segment_name;
    std::vector<std::pair<std::string, std::string>> seed;
    try {
        Config config = argc == 2 ? Config(argv[1]) : Config::Defaults();
        segment_name = config.read_segment_name();
        seed = config.read_seed();
        SetVerbose(config.read_verbose());
    } catch (const std::exception& e) {
        std::cerr << "[Producer] Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    if (std::signal(SIGINT, HandleSignal) == SIG_ERR || std::signal(SIGTERM, HandleSignal) == SIG_ERR) {
        std::cerr << "[Producer] Failed to register signal handlers\n";
        return 1;
    }

    std::cout << "\n==== shmkv producer ====\n";
    std::cout << "Segment:   " << segment_name << "\n";
    std::cout << "Capacity:  " << CAPACITY << " slots\n";
    std::cout << "Key size:  " << KEY_SIZE - 1 << " bytes\n";
    std::cout << "Value size:" << VALUE_SIZE - 1 << " bytes\n";
    std::cout << "========================\n\n";

    Segment segment;
    if (auto ec = Segment::Create(segment_name, segment)) {
        std::cerr << "[Producer] Failed to create segment: " << Describe(ec) << "\n";
        if (ec == Errc::AlreadyExists) {
            std::cerr << "[Producer] Another producer may be running, or a stale segment was left behind."
                      << " Remove it with shmkv-cli or /dev/shm.\n";
        }
        return 2;
    }

    KvStore kv(segment);
    int failures = 0;
    for (const auto& [key, value] : seed) {
        if (auto ec = kv.Put(key, value)) {
            std::cerr << "[Producer] Failed to set '" << key << "': " << Describe(ec) << "\n";
            ++failures;
        } else {
            std::cout << "[Producer] Set '" << key << "' = '" << value << "'\n";
        }
    }
    kv.PrintStatus("Producer Seeded");

    std::cout << "[Producer] Waiting for consumers. Press Ctrl+C to exit.\n";
    while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\n[Producer] Shutting down\n";
    segment.Destroy();
    if (auto ec = Segment::Unlink(segment_name)) {
        std::cerr << "[Producer] Failed to unlink segment: " << Describe(ec) << "\n";
        return 3;
    }
    return failures == 0 ? 0 : 4;
}
