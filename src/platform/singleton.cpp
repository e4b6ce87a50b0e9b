#include "singleton.hpp"
#include <filesystem>
#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

SingletonLock::SingletonLock(const std::string& lock_path) {
    // Ensure parent directory exists
    std::error_code ec;
    std::filesystem::create_directories(
        std::filesystem::path(lock_path).parent_path(), ec);

    fd_ = open(lock_path.c_str(), O_CREAT | O_RDWR, 0644);
    if (fd_ < 0) return;
    if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        close(fd_);
        fd_ = -1;
    }
}

SingletonLock::~SingletonLock() {
    if (fd_ < 0) return;
    close(fd_);
    // flock is released automatically when fd is closed
}
