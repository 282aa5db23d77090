#pragma once

#include <liburing.h>
#include <atomic>

namespace trellis {

class IoJob;

/**
 * Single-threaded io_uring completion loop.
 *
 * This is the cooperative scheduler every connection runs on: each accept,
 * recv and write is submitted as an IoJob, and its continuation runs on the
 * loop thread when the completion arrives. There is no other thread touching
 * connection state, so nothing in the dispatch path takes a lock.
 *
 * Usage:
 *   auto* job = WriteJob::createFromString(fd, data, on_done, on_error);
 *   job->start(loop);   // registerJob + prepareSqe + submit
 */
class EventLoop {
public:
    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * Initialize the ring. Throws std::runtime_error if io_uring is unavailable.
     */
    bool init(unsigned queue_depth = 256);

    /**
     * Run completions until stop() is called (blocking)
     */
    void run();

    /**
     * Request the loop to exit; safe to call from another thread
     */
    void stop();

    /**
     * Get an SQE tagged with the job pointer, or nullptr if the ring is full
     */
    struct io_uring_sqe* registerJob(IoJob* job);

    /**
     * Submit queued SQEs.
     * @return Number of operations submitted, or negative error code
     */
    int submit();

    bool isRunning() const { return running_.load(); }

private:
    void processCompletions();
    void processAvailableCompletions();
    void drainCompletions();
    void handleCompletion(struct io_uring_cqe* cqe);

    struct io_uring ring_;
    bool initialized_;
    std::atomic<bool> running_;
};

} // namespace trellis
