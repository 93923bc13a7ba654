#include "internal.h"
#include "vista/error.h"

#include <chrono>
#include <string>
#include <thread>

#ifdef VISTA_POSIX_LOCK
#  include <cerrno>
#  include <cstring>
#  include <fcntl.h>
#  include <sys/file.h>
#  include <unistd.h>
#endif

namespace vista {
namespace lock {

namespace {

constexpr auto kLockWait  = std::chrono::seconds(30);
constexpr auto kLockPoll  = std::chrono::milliseconds(25);

} // anonymous namespace

#ifdef VISTA_POSIX_LOCK

RepoLock::RepoLock(const std::filesystem::path& gitdir) {
    std::string file = (gitdir / "vista.lock").string();

    fd_ = ::open(file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        throw IoError("open " + file + ": " + std::strerror(errno));
    }

    auto give_up = std::chrono::steady_clock::now() + kLockWait;
    while (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        if (err == EINTR) continue;
        if (err != EWOULDBLOCK || std::chrono::steady_clock::now() >= give_up) {
            ::close(fd_);
            fd_ = -1;
            if (err == EWOULDBLOCK) {
                // Another process holds the lock; a later attempt may succeed.
                throw IoError("repository lock " + file + " is held", true);
            }
            throw IoError("flock " + file + ": " + std::strerror(err));
        }
        std::this_thread::sleep_for(kLockPoll);
    }
}

RepoLock::~RepoLock() {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
}

#else

// Only the store mutex serializes ref updates on this platform.
RepoLock::RepoLock(const std::filesystem::path&) {}
RepoLock::~RepoLock() = default;

#endif

} // namespace lock
} // namespace vista
