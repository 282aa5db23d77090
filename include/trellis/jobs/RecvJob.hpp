#pragma once

#include "trellis/jobs/IoJob.hpp"
#include <functional>
#include <sys/types.h>

namespace trellis {

/**
 * Single-shot recv into a caller-owned buffer.
 * A result of 0 bytes is delivered through on_data (peer closed);
 * negative results go to on_error with a positive errno.
 *
 * The caller keeps the buffer alive until one of the callbacks has run.
 */
class RecvJob : public IoJob {
public:
    using DataCallback = std::function<void(size_t bytes_read)>;
    using ErrorCallback = std::function<void(int error)>;

    static RecvJob* createFromPool(int fd, char* buffer, size_t capacity,
                                   DataCallback on_data, ErrorCallback on_error);

    static void freePoolAllocated(RecvJob* job);

    void prepareSqe(struct io_uring_sqe* sqe) override;
    std::optional<CleanupCallback> handleCompletion(EventLoop& loop, struct io_uring_cqe* cqe) override;

    /**
     * Submit the recv. If no SQE can be obtained the job reports EAGAIN
     * and returns itself to the pool.
     */
    void start(EventLoop& loop);

    RecvJob(int fd, char* buffer, size_t capacity);

private:
    int fd_;
    char* buffer_;
    size_t capacity_;

    DataCallback on_data_;
    ErrorCallback on_error_;
};

} // namespace trellis
