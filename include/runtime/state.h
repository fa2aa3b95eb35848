#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace chatgw {

extern std::atomic<bool> g_running_flag;
extern std::atomic<unsigned int> g_active_streams;
extern std::atomic<uint64_t> g_total_streams;

inline bool is_running() { return g_running_flag.load(); }
inline void request_shutdown() { g_running_flag.store(false); }

inline unsigned int active_stream_count() { return g_active_streams.load(); }
inline uint64_t total_stream_count() { return g_total_streams.load(); }

// Blocks until no stream relay is alive or `timeout` elapses.
// Returns true if every relay has finished.
bool wait_for_streams_idle(std::chrono::milliseconds timeout);

// Counts one live stream relay for as long as it exists.
class StreamGuard {
public:
    StreamGuard();
    ~StreamGuard();

    StreamGuard(const StreamGuard&) = delete;
    StreamGuard& operator=(const StreamGuard&) = delete;
};

}  // namespace chatgw
