#ifndef SHMKV_LOG_HPP
#define SHMKV_LOG_HPP

namespace shmkv {

// Process-wide switch for chatty per-operation logging.
// Lifecycle events and failures are always logged.
void SetVerbose(bool verbose);
bool IsVerbose();

} // namespace shmkv

#endif // SHMKV_LOG_HPP
