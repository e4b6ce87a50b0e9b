#include "platform.hpp"
#include <cstdlib>
#include <ctime>
#include <random>
#include <mutex>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path temp_file(const std::string& prefix, const std::string& extension) {
    // Use pid + random for uniqueness
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)) ^
                            static_cast<unsigned>(getpid()));
    static std::mutex rng_mutex;
    std::uniform_int_distribution<int> dist(10000, 99999);
    int n;
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        n = dist(rng);
    }
    return temp_dir() / (prefix + "_" + std::to_string(getpid()) + "_" +
                         std::to_string(n) + extension);
}

void sleep_ms(int ms) {
    if (ms <= 0) return;
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
