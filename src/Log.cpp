#include "Log.hpp"
#include <atomic>
#include <mutex>

namespace andes {

namespace {
std::atomic<bool> verbose_enabled{false};
// Capture and configuration threads log concurrently.
std::mutex output_mutex;
}

void dprintf(const char* format, ...) {
    std::lock_guard<std::mutex> lock(output_mutex);
    va_list args;
    va_start(args, format);
    vprintf(format, args);
    va_end(args);
    fflush(stdout);
}

void set_verbose(bool verbose) {
    verbose_enabled = verbose;
}

bool is_verbose() {
    return verbose_enabled;
}

void verbose_printf(const char* format, ...) {
    if (!verbose_enabled) return;
    std::lock_guard<std::mutex> lock(output_mutex);
    va_list args;
    va_start(args, format);
    vprintf(format, args);
    va_end(args);
    fflush(stdout);
}

}
