#ifndef ANDES_CLEANUP_HELPER_HPP
#define ANDES_CLEANUP_HELPER_HPP

#include <functional>

namespace andes {

// Runs deleter on any scope exit unless dismissed. Used right after acquiring a C handle.
class CleanupHelper {
public:
    explicit CleanupHelper(const std::function<void()>& deleter) : deleter(deleter) {}

    CleanupHelper(const CleanupHelper&) = delete;
    CleanupHelper& operator=(const CleanupHelper&) = delete;

    ~CleanupHelper() {
        if (deleter) {
            deleter();
        }
    }

    // Ownership was handed over, nothing left to clean up.
    void dismiss() { deleter = nullptr; }

private:
    std::function<void()> deleter;
};

}

#endif
