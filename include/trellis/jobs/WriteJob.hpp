#pragma once

#include "trellis/jobs/IoJob.hpp"
#include <functional>
#include <memory>
#include <string>

namespace trellis {

/**
 * Job for writing data to a file descriptor.
 * Handles partial writes by resubmitting until all data is sent.
 *
 * All WriteJobs are pool-allocated and return themselves to the pool once
 * a callback has fired.
 */
class WriteJob : public IoJob {
public:
    using CompletionCallback = std::function<void(int fd, size_t bytes_written)>;
    using ErrorCallback = std::function<void(int fd, int error)>;

    /**
     * Create write job owning a copy of the given string.
     * @return Pool-allocated WriteJob, or nullptr if the pool is exhausted
     */
    static WriteJob* createFromString(int fd, std::string data,
                                      CompletionCallback on_complete = nullptr,
                                      ErrorCallback on_error = nullptr);

    static void freePoolAllocated(WriteJob* job);

    void prepareSqe(struct io_uring_sqe* sqe) override;
    std::optional<CleanupCallback> handleCompletion(EventLoop& loop, struct io_uring_cqe* cqe) override;

    void start(EventLoop& loop);

    WriteJob(int fd, std::string data);

private:
    // false if the job failed and already returned itself to the pool
    bool submitWrite(EventLoop& loop);
    void fail(int error);

    int fd_;
    std::string data_;
    size_t bytes_written_;

    CompletionCallback on_complete_;
    ErrorCallback on_error_;
};

} // namespace trellis
