#include "shmkv/log.hpp"

#include <atomic>

namespace shmkv {

namespace {
std::atomic<bool> verbose_logging{false};
}

void SetVerbose(bool verbose) {
    verbose_logging.store(verbose);
}

bool IsVerbose() {
    return verbose_logging.load();
}

} // namespace shmkv
