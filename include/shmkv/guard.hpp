#ifndef SHMKV_GUARD_HPP
#define SHMKV_GUARD_HPP

#include <boost/interprocess/sync/interprocess_semaphore.hpp>

namespace shmkv {

// Binary process-shared lock placed inline in the segment.
// Backed by a semaphore with an initial count of 1, so no process owns it:
// any attached process may release what another acquired.
// Satisfies the Boost lockable interface, use it through
// boost::interprocess::scoped_lock<Guard>.
//
// A process that dies while holding the guard wedges every other process.
// There is no timeout and no staleness detection.
class Guard {
public:
    Guard();

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;

    // Blocks until the guard is available.
    void lock();

    // Non-blocking acquire, true if the guard was taken.
    bool try_lock();

    // Wakes at most one waiter.
    void unlock();

private:
    boost::interprocess::interprocess_semaphore semaphore;
};

} // namespace shmkv

#endif // SHMKV_GUARD_HPP
