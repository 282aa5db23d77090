#include "trellis/EventLoop.hpp"
#include "trellis/jobs/IoJob.hpp"
#include "trellis/logger/Logger.hpp"
#include <liburing.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>

namespace {
class WakeupJob final : public trellis::IoJob {
public:
    void prepareSqe(struct io_uring_sqe* sqe) override {
        io_uring_prep_nop(sqe);
    }

    std::optional<CleanupCallback> handleCompletion(trellis::EventLoop&, struct io_uring_cqe*) override {
        // Only exists to wake io_uring_wait_cqe during shutdown
        return std::nullopt;
    }
};

WakeupJob g_wakeup_job;

constexpr int MAX_DRAIN_ITERATIONS = 100;
}

namespace trellis {

EventLoop::EventLoop()
    : ring_{}, initialized_(false), running_(false) {
}

EventLoop::~EventLoop() {
    stop();
    if (initialized_) {
        io_uring_queue_exit(&ring_);
    }
}

bool EventLoop::init(unsigned queue_depth) {
    int ret = io_uring_queue_init(queue_depth, &ring_, 0);
    if (ret < 0) {
        throw std::runtime_error("Failed to initialize io_uring: " + std::string(strerror(-ret)));
    }
    initialized_ = true;

    Logger::getInstance().logMessage("EventLoop initialized with queue depth " + std::to_string(queue_depth));
    return true;
}

void EventLoop::run() {
    running_ = true;

    while (running_) {
        processCompletions();
    }

    drainCompletions();
    Logger::getInstance().logMessage("EventLoop: Stopped with all completions drained");
}

void EventLoop::stop() {
    running_ = false;

    if (!initialized_) {
        return;
    }

    // Wake the loop in case it's blocked in io_uring_wait_cqe
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring_);
    if (!sqe) {
        io_uring_submit(&ring_);
        sqe = io_uring_get_sqe(&ring_);
    }

    if (sqe) {
        g_wakeup_job.prepareSqe(sqe);
        io_uring_sqe_set_data64(sqe, reinterpret_cast<uintptr_t>(&g_wakeup_job));
        io_uring_submit(&ring_);
    } else {
        Logger::getInstance().logError("EventLoop: Unable to acquire SQE for shutdown wakeup");
    }
}

struct io_uring_sqe* EventLoop::registerJob(IoJob* job) {
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring_);
    if (!sqe) {
        return nullptr;
    }

    io_uring_sqe_set_data64(sqe, reinterpret_cast<uintptr_t>(job));
    return sqe;
}

int EventLoop::submit() {
    return io_uring_submit(&ring_);
}

void EventLoop::processCompletions() {
    struct io_uring_cqe* cqe;

    int ret = io_uring_wait_cqe(&ring_, &cqe);
    if (ret < 0) {
        if (ret != -EINTR) {
            Logger::getInstance().logError("io_uring_wait_cqe failed: " + std::string(strerror(-ret)));
        }
        return;
    }

    processAvailableCompletions();
}

void EventLoop::processAvailableCompletions() {
    struct io_uring_cqe* cqe;
    unsigned head;
    unsigned handled = 0;

    io_uring_for_each_cqe(&ring_, head, cqe) {
        handleCompletion(cqe);
        handled++;
    }

    io_uring_cq_advance(&ring_, handled);
}

void EventLoop::drainCompletions() {
    struct io_uring_cqe* cqe;
    int iterations = 0;

    while (iterations < MAX_DRAIN_ITERATIONS) {
        if (io_uring_peek_cqe(&ring_, &cqe) < 0) {
            break;
        }
        processAvailableCompletions();
        iterations++;
    }
}

void EventLoop::handleCompletion(struct io_uring_cqe* cqe) {
    uint64_t user_data = io_uring_cqe_get_data64(cqe);
    if (user_data == 0) {
        Logger::getInstance().logError("EventLoop: Completion with null user_data");
        return;
    }

    auto* job = reinterpret_cast<IoJob*>(user_data);
    std::optional<IoJob::CleanupCallback> cleanup;
    try {
        cleanup = job->handleCompletion(*this, cqe);
    } catch (...) {
        // Job state is unknown after a throwing callback, so it is not reclaimed
        Logger::getInstance().logCurrentError("EventLoop: completion callback threw");
        return;
    }
    if (cleanup) {
        (*cleanup)(job);
    }
}

} // namespace trellis
