#include "runtime/state.h"

#include <condition_variable>
#include <mutex>

namespace chatgw {

std::atomic<bool> g_running_flag{true};
std::atomic<unsigned int> g_active_streams{0};
std::atomic<uint64_t> g_total_streams{0};

namespace {
std::mutex g_streams_mutex;
std::condition_variable g_streams_idle_cv;
}  // namespace

StreamGuard::StreamGuard() {
    g_active_streams.fetch_add(1);
    g_total_streams.fetch_add(1);
}

StreamGuard::~StreamGuard() {
    std::lock_guard<std::mutex> lock(g_streams_mutex);
    if (g_active_streams.fetch_sub(1) == 1) {
        g_streams_idle_cv.notify_all();
    }
}

bool wait_for_streams_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(g_streams_mutex);
    return g_streams_idle_cv.wait_for(lock, timeout, [] { return g_active_streams.load() == 0; });
}

}  // namespace chatgw
