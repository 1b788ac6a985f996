#include "shmkv/guard.hpp"

namespace shmkv {

Guard::Guard() : semaphore(1) {}

void Guard::lock() {
    semaphore.wait();
}

bool Guard::try_lock() {
    return semaphore.try_wait();
}

void Guard::unlock() {
    semaphore.post();
}

} // namespace shmkv
