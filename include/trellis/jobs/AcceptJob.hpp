#pragma once

#include "trellis/jobs/IoJob.hpp"
#include <functional>
#include <sys/socket.h>

namespace trellis {

/**
 * Job for accepting new connections using multishot accept.
 * One job per listening socket; it resubmits itself whenever the kernel
 * terminates the multishot request.
 */
class AcceptJob : public IoJob {
public:
    using ConnectionCallback = std::function<void(int client_fd)>;
    using ErrorCallback = std::function<void(int error)>;

    /**
     * Create a multishot accept job from the lock-free pool
     * @return New AcceptJob, or nullptr if the pool is exhausted
     */
    static AcceptJob* create(int server_fd,
                             ConnectionCallback on_connection,
                             ErrorCallback on_error = nullptr);

    static void freePoolAllocated(AcceptJob* job);

    void prepareSqe(struct io_uring_sqe* sqe) override;
    std::optional<CleanupCallback> handleCompletion(EventLoop& loop, struct io_uring_cqe* cqe) override;

    void start(EventLoop& loop);

    explicit AcceptJob(int server_fd);

private:
    void submitAccept(EventLoop& loop);

    int server_fd_;
    ConnectionCallback on_connection_;
    ErrorCallback on_error_;
};

} // namespace trellis
