#include "trellis/jobs/RecvJob.hpp"
#include "trellis/EventLoop.hpp"
#include "trellis/logger/Logger.hpp"
#include "LockFreeMemoryPool.h"
#include <liburing.h>
#include <cerrno>
#include <string>

// One outstanding recv per connection at most
DEFINE_LOCKFREE_POOL(trellis::RecvJob, 10000);

namespace {
void cleanupRecvJob(trellis::IoJob* job) {
    trellis::RecvJob::freePoolAllocated(static_cast<trellis::RecvJob*>(job));
}
}

namespace trellis {

RecvJob::RecvJob(int fd, char* buffer, size_t capacity)
    : fd_(fd), buffer_(buffer), capacity_(capacity) {
}

RecvJob* RecvJob::createFromPool(int fd, char* buffer, size_t capacity,
                                 DataCallback on_data, ErrorCallback on_error) {
    RecvJob* job = lfmemorypool::lockfree_pool_alloc_fast<RecvJob>(fd, buffer, capacity);
    if (job) {
        job->on_data_ = std::move(on_data);
        job->on_error_ = std::move(on_error);
    }
    return job;
}

void RecvJob::freePoolAllocated(RecvJob* job) {
    if (job) {
        lfmemorypool::lockfree_pool_free_fast<RecvJob>(job);
    }
}

void RecvJob::prepareSqe(struct io_uring_sqe* sqe) {
    io_uring_prep_recv(sqe, fd_, buffer_, capacity_, 0);
}

std::optional<IoJob::CleanupCallback> RecvJob::handleCompletion(EventLoop&, struct io_uring_cqe* cqe) {
    int result = cqe->res;

    if (result < 0) {
        if (on_error_) {
            on_error_(-result);
        }
        return cleanupRecvJob;
    }

    if (on_data_) {
        on_data_(static_cast<size_t>(result));
    }
    return cleanupRecvJob;
}

void RecvJob::start(EventLoop& loop) {
    struct io_uring_sqe* sqe = loop.registerJob(this);
    if (!sqe) {
        int flush_ret = loop.submit();
        sqe = flush_ret >= 0 ? loop.registerJob(this) : nullptr;
    }

    if (!sqe) {
        Logger::getInstance().logError("RecvJob: Unable to acquire SQE for fd=" + std::to_string(fd_));
        auto on_error = std::move(on_error_);
        freePoolAllocated(this);
        if (on_error) {
            on_error(EAGAIN);
        }
        return;
    }

    prepareSqe(sqe);
    int ret = loop.submit();
    if (ret < 0) {
        Logger::getInstance().logError("RecvJob: io_uring_submit failed: error=" + std::to_string(-ret));
    }
}

} // namespace trellis
