#include "trellis/jobs/WriteJob.hpp"
#include "trellis/EventLoop.hpp"
#include "trellis/logger/Logger.hpp"
#include "LockFreeMemoryPool.h"
#include <liburing.h>
#include <cerrno>
#include <sys/socket.h>
#include <string>

// Hot path: every response goes through here
DEFINE_LOCKFREE_POOL(trellis::WriteJob, 10000);

namespace {
void cleanupWriteJob(trellis::IoJob* job) {
    trellis::WriteJob::freePoolAllocated(static_cast<trellis::WriteJob*>(job));
}
}

namespace trellis {

WriteJob::WriteJob(int fd, std::string data)
    : fd_(fd), data_(std::move(data)), bytes_written_(0) {
}

WriteJob* WriteJob::createFromString(int fd, std::string data,
                                     CompletionCallback on_complete,
                                     ErrorCallback on_error) {
    WriteJob* job = lfmemorypool::lockfree_pool_alloc_fast<WriteJob>(fd, std::move(data));
    if (!job) {
        return nullptr;
    }
    job->on_complete_ = std::move(on_complete);
    job->on_error_ = std::move(on_error);
    return job;
}

void WriteJob::freePoolAllocated(WriteJob* job) {
    if (job) {
        lfmemorypool::lockfree_pool_free_fast<WriteJob>(job);
    }
}

std::optional<IoJob::CleanupCallback> WriteJob::handleCompletion(EventLoop& loop, struct io_uring_cqe* cqe) {
    int result = cqe->res;

    if (result < 0) {
        if (on_error_) {
            on_error_(fd_, -result);
        }
        return cleanupWriteJob;
    }

    bytes_written_ += static_cast<size_t>(result);

    if (bytes_written_ >= data_.size()) {
        if (on_complete_) {
            on_complete_(fd_, bytes_written_);
        }
        return cleanupWriteJob;
    }

    // Partial write - continue with remaining data
    submitWrite(loop);
    return std::nullopt;
}

void WriteJob::start(EventLoop& loop) {
    if (data_.empty()) {
        auto on_complete = std::move(on_complete_);
        int fd = fd_;
        freePoolAllocated(this);
        if (on_complete) {
            on_complete(fd, 0);
        }
        return;
    }
    submitWrite(loop);
}

void WriteJob::prepareSqe(struct io_uring_sqe* sqe) {
    const char* remaining = data_.data() + bytes_written_;
    size_t remaining_length = data_.size() - bytes_written_;
    io_uring_prep_send(sqe, fd_, remaining, remaining_length, MSG_NOSIGNAL);
}

bool WriteJob::submitWrite(EventLoop& loop) {
    struct io_uring_sqe* sqe = loop.registerJob(this);
    if (!sqe) {
        int flush_ret = loop.submit();
        if (flush_ret < 0) {
            Logger::getInstance().logError("WriteJob: Failed to flush pending submissions: error=" + std::to_string(-flush_ret));
            fail(-flush_ret);
            return false;
        }

        sqe = loop.registerJob(this);
        if (!sqe) {
            Logger::getInstance().logError("WriteJob: Unable to acquire SQE");
            fail(EAGAIN);
            return false;
        }
    }

    prepareSqe(sqe);
    int ret = loop.submit();
    if (ret < 0) {
        // The SQE stays queued and goes out with the next successful submit
        Logger::getInstance().logError("WriteJob: io_uring_submit failed: error=" + std::to_string(-ret));
    }
    return true;
}

void WriteJob::fail(int error) {
    auto on_error = std::move(on_error_);
    int fd = fd_;
    freePoolAllocated(this);
    if (on_error) {
        on_error(fd, error);
    }
}

} // namespace trellis
