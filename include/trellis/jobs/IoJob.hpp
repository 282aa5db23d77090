#pragma once

#include <optional>

// Forward declarations to avoid including liburing.h in headers
struct io_uring_cqe;
struct io_uring_sqe;

namespace trellis {

class EventLoop;

/**
 * Base interface for all io_uring operations.
 * A job carries the buffers and continuations for one pending operation;
 * its address is the SQE user_data.
 */
class IoJob {
public:
    using CleanupCallback = void(*)(IoJob*);

    virtual ~IoJob() = default;

    /**
     * Configure the SQE for this job's operation.
     */
    virtual void prepareSqe(struct io_uring_sqe* sqe) = 0;

    /**
     * Handle completion of the operation.
     * @return Optional cleanup function run by the loop after this call returns
     */
    virtual std::optional<CleanupCallback> handleCompletion(EventLoop& loop, struct io_uring_cqe* cqe) = 0;
};

} // namespace trellis
