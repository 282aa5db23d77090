#include "trellis/jobs/AcceptJob.hpp"
#include "trellis/EventLoop.hpp"
#include "LockFreeMemoryPool.h"
#include <liburing.h>
#include <cerrno>

// Usually a single accept job per listening socket
DEFINE_LOCKFREE_POOL(trellis::AcceptJob, 16);

namespace {
void cleanupAcceptJob(trellis::IoJob* job) {
    trellis::AcceptJob::freePoolAllocated(static_cast<trellis::AcceptJob*>(job));
}
}

namespace trellis {

AcceptJob::AcceptJob(int server_fd)
    : server_fd_(server_fd) {
}

AcceptJob* AcceptJob::create(int server_fd,
                             ConnectionCallback on_connection,
                             ErrorCallback on_error) {
    AcceptJob* job = lfmemorypool::lockfree_pool_alloc_fast<AcceptJob>(server_fd);
    if (job) {
        job->on_connection_ = std::move(on_connection);
        job->on_error_ = std::move(on_error);
    }
    return job;
}

void AcceptJob::freePoolAllocated(AcceptJob* job) {
    if (job) {
        lfmemorypool::lockfree_pool_free_fast<AcceptJob>(job);
    }
}

std::optional<IoJob::CleanupCallback> AcceptJob::handleCompletion(EventLoop& loop, struct io_uring_cqe* cqe) {
    int result = cqe->res;
    bool more = (cqe->flags & IORING_CQE_F_MORE) != 0;

    if (result < 0) {
        if (on_error_) {
            on_error_(-result);
        }
        // Listening socket closed during shutdown
        if (-result == ECANCELED || -result == EBADF || -result == EINVAL) {
            return more ? std::nullopt : std::optional<CleanupCallback>(cleanupAcceptJob);
        }
        if (!more) {
            submitAccept(loop);
        }
        return std::nullopt;
    }

    if (on_connection_) {
        on_connection_(result);
    }

    // Multishot terminated - resubmit to keep accepting
    if (!more) {
        submitAccept(loop);
    }
    return std::nullopt;
}

void AcceptJob::start(EventLoop& loop) {
    submitAccept(loop);
}

void AcceptJob::prepareSqe(struct io_uring_sqe* sqe) {
    io_uring_prep_multishot_accept(sqe, server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
}

void AcceptJob::submitAccept(EventLoop& loop) {
    struct io_uring_sqe* sqe = loop.registerJob(this);
    if (sqe) {
        prepareSqe(sqe);
        loop.submit();
    } else if (on_error_) {
        on_error_(EAGAIN);
    }
}

} // namespace trellis
