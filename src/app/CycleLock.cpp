#include "app/CycleLock.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/file.h>
#include <thread>
#include <unistd.h>

namespace hostwatch::app {

namespace {
constexpr auto POLL_INTERVAL = std::chrono::milliseconds(50);
}

CycleLock::CycleLock(const std::filesystem::path& path, std::chrono::milliseconds wait) {
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        throw std::runtime_error("Failed to open lock file " + path.string() + ": " +
                                 std::strerror(errno));
    }

    auto deadline = std::chrono::steady_clock::now() + wait;
    while (true) {
        if (::flock(fd_, LOCK_EX | LOCK_NB) == 0) {
            acquired_ = true;
            spdlog::debug("Acquired cycle lock {}", path.string());
            return;
        }

        if (errno != EWOULDBLOCK && errno != EINTR) {
            spdlog::error("Failed to lock {}: {}", path.string(), std::strerror(errno));
            return;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::debug("Cycle lock {} still held after {} ms", path.string(), wait.count());
            return;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
}

CycleLock::~CycleLock() {
    if (fd_ >= 0) {
        if (acquired_) {
            ::flock(fd_, LOCK_UN);
        }
        ::close(fd_);
    }
}

} // namespace hostwatch::app
