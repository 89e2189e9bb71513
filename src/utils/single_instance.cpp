#include "utils/single_instance.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

namespace zackathon {
namespace utils {

namespace {

bool setLock(int fd, short type) {
    struct flock fl;
    std::memset(&fl, 0, sizeof(fl));
    fl.l_type = type;
    fl.l_whence = SEEK_SET;
    int rc;
    do {
        rc = fcntl(fd, F_SETLK, &fl);
    } while (rc != 0 && errno == EINTR);
    return rc == 0;
}

pid_t lockOwner(int fd) {
    struct flock fl;
    std::memset(&fl, 0, sizeof(fl));
    fl.l_type = F_WRLCK;
    fl.l_whence = SEEK_SET;
    if (fcntl(fd, F_GETLK, &fl) != 0 || fl.l_type == F_UNLCK) return -1;
    return fl.l_pid;
}

bool writePid(int fd) {
    std::string data = std::to_string(static_cast<long>(getpid())) + "\n";
    if (ftruncate(fd, 0) != 0 || lseek(fd, 0, SEEK_SET) < 0) return false;
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n > 0) {
            off += static_cast<size_t>(n);
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            return false;
        }
    }
    return fsync(fd) == 0;
}

}

std::unique_ptr<SingleInstanceLock> SingleInstanceLock::acquire(const std::string& dataDir,
                                                                std::string* errorOut) {
    std::error_code ec;
    std::filesystem::create_directories(dataDir, ec);
    if (ec) {
        if (errorOut) *errorOut = "Cannot create " + dataDir + ": " + ec.message();
        return nullptr;
    }

    std::unique_ptr<SingleInstanceLock> lock(new SingleInstanceLock());
    lock->lockPath_ = dataDir + "/zackathond.lock";

    int fd = ::open(lock->lockPath_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errorOut) *errorOut = "Cannot open " + lock->lockPath_ + ": " + std::strerror(errno);
        return nullptr;
    }

    if (!setLock(fd, F_WRLCK)) {
        pid_t owner = lockOwner(fd);
        ::close(fd);
        if (errorOut) {
            *errorOut = "Another zackathond is using " + dataDir;
            if (owner > 0) *errorOut += " (pid " + std::to_string(owner) + ")";
        }
        return nullptr;
    }

    if (!writePid(fd)) {
        setLock(fd, F_UNLCK);
        ::close(fd);
        if (errorOut) *errorOut = "Cannot write " + lock->lockPath_;
        return nullptr;
    }

    lock->fd_ = fd;
    return lock;
}

SingleInstanceLock::~SingleInstanceLock() {
    if (fd_ >= 0) {
        setLock(fd_, F_UNLCK);
        ::close(fd_);
        fd_ = -1;
    }
}

}
}
