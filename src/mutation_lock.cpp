#include "mutation_lock.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace routecompose {

namespace {

const char* kComponent = "MutationLock";

} // namespace

MutationLock::Guard::Guard(MutationLock* lock, int fd)
    : lock_(lock), fd_(fd) {
}

MutationLock::Guard::Guard(Guard&& other) noexcept
    : lock_(other.lock_), fd_(other.fd_) {
    other.lock_ = nullptr;
    other.fd_ = -1;
}

MutationLock::Guard& MutationLock::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        release();
        lock_ = other.lock_;
        fd_ = other.fd_;
        other.lock_ = nullptr;
        other.fd_ = -1;
    }
    return *this;
}

MutationLock::Guard::~Guard() {
    release();
}

void MutationLock::Guard::release() {
    if (lock_ == nullptr) {
        return;
    }
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        close(fd_);
        fd_ = -1;
    }
    lock_->mutex_.unlock();
    lock_ = nullptr;
    Logger::debug(kComponent, "Mutation lock released");
}

MutationLock::MutationLock(std::string lock_file)
    : lock_file_(std::move(lock_file)) {
}

MutationLock::Guard MutationLock::acquire() {
    if (!mutex_.try_lock()) {
        throw ApplyError(ApplyError::Kind::Busy,
                         "Another apply or rollback session is in progress");
    }

    if (lock_file_.empty()) {
        return Guard(this, -1);
    }

    int fd = open(lock_file_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        int error = errno;
        mutex_.unlock();
        throw ApplyError(ApplyError::Kind::LockUnavailable,
                         "Cannot open lock file " + lock_file_ + ": " + std::strerror(error));
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int error = errno;
        close(fd);
        mutex_.unlock();
        if (error == EWOULDBLOCK) {
            throw ApplyError(ApplyError::Kind::Busy,
                             "Another process holds the mutation lock " + lock_file_);
        }
        throw ApplyError(ApplyError::Kind::LockUnavailable,
                         "Cannot lock " + lock_file_ + ": " + std::strerror(error));
    }

    Logger::debug(kComponent, "Mutation lock acquired: " + lock_file_);
    return Guard(this, fd);
}

} // namespace routecompose
