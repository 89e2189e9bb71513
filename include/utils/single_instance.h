#pragma once

#include <memory>
#include <string>

namespace zackathon {
namespace utils {

// Advisory fcntl lock on <dataDir>/zackathond.lock, held for the lifetime of
// the object. The file records the owner's pid.
class SingleInstanceLock {
public:
    static std::unique_ptr<SingleInstanceLock> acquire(const std::string& dataDir,
                                                       std::string* errorOut = nullptr);
    ~SingleInstanceLock();

    SingleInstanceLock(const SingleInstanceLock&) = delete;
    SingleInstanceLock& operator=(const SingleInstanceLock&) = delete;

    const std::string& path() const { return lockPath_; }

private:
    SingleInstanceLock() = default;

    std::string lockPath_;
    int fd_ = -1;
};

}
}
