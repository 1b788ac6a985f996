#include <chrono>
#include <iostream>
#include <limits>
#include <string>
#include <thread>

#include "shmkv/config.hpp"
#include "shmkv/errors.hpp"
#include "shmkv/kvstore.hpp"
#include "shmkv/log.hpp"
#include "shmkv/segment.hpp"

using namespace shmkv;

namespace {

constexpr int ATTACH_RETRIES = 20;

// Open, and create if not found. This fallback is a caller policy, the
// segment manager never does it on its own.
std::error_code Attach(const std::string& name, Segment& segment) {
    std::error_code ec = Segment::Open(name, segment);
    if (ec == Errc::NotFound) {
        std::cout << "[Cli] No segment named '" << name << "', creating it\n";
        ec = Segment::Create(name, segment);
        if (ec == Errc::AlreadyExists) {
            // Lost a creation race with another process.
            ec = Segment::Open(name, segment);
        }
    }
    // Another process is still between sizing and initializing the segment.
    for (int attempt = 0; ec == Errc::NotInitialized && attempt < ATTACH_RETRIES; ++attempt) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        ec = Segment::Open(name, segment);
    }
    return ec;
}

std::string Prompt(const std::string& text) {
    std::cout << text;
    std::string line;
    std::getline(std::cin, line);
    return line;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config.json]\n";
        return 1;
    }

    std::string segment_name;
    try {
        Config config = argc == 2 ? Config(argv[1]) : Config::Defaults();
        segment_name = config.read_segment_name();
        SetVerbose(config.read_verbose());
    } catch (const std::exception& e) {
        std::cerr << "[Cli] Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    Segment segment;
    if (auto ec = Attach(segment_name, segment)) {
        std::cerr << "[Cli] Could not attach to '" << segment_name << "': " << Describe(ec) << "\n";
        return 2;
    }
    KvStore kv(segment);

    int choice;
    while (true) {
        std::cout << "\n1. Get from Shared Mem\n";
        std::cout << "2. Put into Shared Mem\n";
        std::cout << "3. Delete from Shared Mem\n";
        std::cout << "4. Show status\n";
        std::cout << "5. Unlink segment and exit\n";
        std::cout << "6. Exit\n";
        std::cout << "Enter your choice: ";
        std::cin >> choice;

        if (std::cin.eof()) {
            std::cout << "\nExiting program.\n";
            return 0;
        }
        if (std::cin.fail()) {
            std::cin.clear(); // Clear the fail flag
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n'); // Discard bad input
            std::cout << "Invalid input. Please enter a number between 1 and 6.\n";
            continue;
        }
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');

        switch (choice) {
            case 1: {
                std::string key = Prompt("Enter the key to find its value: ");
                Entry entry;
                if (auto ec = kv.Get(key, entry)) {
                    std::cout << "Get failed: " << Describe(ec) << "\n";
                } else {
                    std::cout << "Found key " << entry.key << " with value: " << entry.value
                              << " (updated at " << entry.timestamp << ")\n";
                }
                break;
            }
            case 2: {
                std::string key = Prompt("Enter the key: ");
                std::string value = Prompt("Enter the value: ");
                if (auto ec = kv.Put(key, value)) {
                    std::cout << "Put failed: " << Describe(ec) << "\n";
                } else {
                    std::cout << "Stored key " << key << " with value: " << value << "\n";
                }
                break;
            }
            case 3: {
                std::string key = Prompt("Enter the key to delete: ");
                if (auto ec = kv.Delete(key)) {
                    std::cout << "Delete failed: " << Describe(ec) << "\n";
                } else {
                    std::cout << "Key " << key << " deleted.\n";
                }
                break;
            }
            case 4: {
                kv.PrintStatus("Cli");
                break;
            }
            case 5: {
                segment.Destroy();
                if (auto ec = Segment::Unlink(segment_name)) {
                    std::cerr << "Unlink failed: " << Describe(ec) << "\n";
                    return 3;
                }
                std::cout << "Exiting program.\n";
                return 0;
            }
            case 6: {
                std::cout << "Exiting program.\n";
                return 0;
            }
            default:
                std::cout << "Invalid Choice. Try again.\n";
        }
    }
}
