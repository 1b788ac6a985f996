// shmkv-consumer: attaches to a running producer's store and follows changes.
#include <chrono>
#include <csignal>
#include <iostream>
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

void ReadAndDisplay(const KvStore& kv, const std::string& key) {
    Entry entry;
    std::error_code ec = kv.Get(key, entry);
    if (!ec) {
        std::cout << "[Consumer] Got '" << key << "' = '" << entry.value << "'\n";
    } else if (ec == Errc::NotFound) {
        std::cout << "[Consumer] Key '" << key << "' not found\n";
    } else {
        std::cerr << "[Consumer] Failed to get '" << key << "': " << Describe(ec) << "\n";
    }
}
} // namespace

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config.json]\n";
        return 1;
    }

    std::string segment_name;
    std::vector<std::string> watch_keys;
    int poll_interval_ms = 0;
    try {
        Config config = argc == 2 ? Config(argv[1]) : Config::Defaults();
        segment_name = config.read_segment_name();
        watch_keys = config.read_watch_keys();
        poll_interval_ms = config.read_poll_interval_ms();
        SetVerbose(config.read_verbose());
    } catch (const std::exception& e) {
        std::cerr << "[Consumer] Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    if (std::signal(SIGINT, HandleSignal) == SIG_ERR || std::signal(SIGTERM, HandleSignal) == SIG_ERR) {
        std::cerr << "[Consumer] Failed to register signal handlers\n";
        return 1;
    }

    Segment segment;
    if (auto ec = Segment::Open(segment_name, segment)) {
        std::cerr << "[Consumer] Failed to open segment '" << segment_name << "': " << Describe(ec) << "\n";
        if (ec == Errc::NotFound) {
            std::cerr << "[Consumer] Make sure the producer is running first!\n";
        }
        return 2;
    }

    KvStore kv(segment);
    std::uint32_t last_version = 0;
    std::cout << "[Consumer] Following '" << segment_name << "'. Press Ctrl+C to exit.\n";

    while (running) {
        StatusSnapshot snapshot;
        if (auto ec = kv.Status(snapshot)) {
            std::cerr << "[Consumer] Status failed: " << Describe(ec) << "\n";
            return 3;
        }
        if (snapshot.version != last_version) {
            std::cout << "\n--- Store updated (version " << last_version << " -> " << snapshot.version << ") ---\n";
            last_version = snapshot.version;
            if (watch_keys.empty()) {
                for (const auto& entry : snapshot.entries) {
                    std::cout << "[Consumer] '" << entry.key << "' = '" << entry.value << "'\n";
                }
            } else {
                for (const auto& key : watch_keys) {
                    ReadAndDisplay(kv, key);
                }
            }
            std::cout << "[Consumer] Waiting for updates... (version: " << snapshot.version
                      << ", entries: " << snapshot.entry_count << ")\n";
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_ms));
    }

    std::cout << "\n[Consumer] Exiting, segment left in place\n";
    segment.Destroy();
    return 0;
}
