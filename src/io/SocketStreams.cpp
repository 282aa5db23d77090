#include "trellis/io/SocketStreams.hpp"
#include "trellis/EventLoop.hpp"
#include "trellis/jobs/RecvJob.hpp"
#include "trellis/jobs/WriteJob.hpp"
#include "trellis/logger/Logger.hpp"
#include <cerrno>
#include <string>
#include <unistd.h>

namespace trellis {

SocketReader::SocketReader(EventLoop& loop, int fd)
    : loop_(loop)
    , fd_(fd)
    , recv_buffer_(std::make_unique<char[]>(RECV_BUFFER_SIZE)) {
}

void SocketReader::fillBuffer(FillCallback on_data, ErrorCallback on_error) {
    auto self = shared_from_this();
    auto* job = RecvJob::createFromPool(
        fd_, recv_buffer_.get(), RECV_BUFFER_SIZE,
        [self, on_data = std::move(on_data)](size_t bytes_read) {
            on_data(self->recv_buffer_.get(), bytes_read);
        },
        [self, on_error](int error) {
            on_error(error);
        });

    if (!job) {
        Logger::getInstance().logError("SocketReader: RecvJob pool exhausted for fd=" + std::to_string(fd_));
        on_error(ENOMEM);
        return;
    }
    job->start(loop_);
}

SocketWriter::SocketWriter(EventLoop& loop, int fd)
    : loop_(loop), fd_(fd) {
}

SocketWriter::~SocketWriter() {
    release();
}

void SocketWriter::write(std::string data, DoneCallback on_done, ErrorCallback on_error) {
    if (closing_) {
        on_error(EBADF);
        return;
    }

    auto self = shared_from_this();
    auto* job = WriteJob::createFromString(
        fd_, std::move(data),
        [self, on_done = std::move(on_done)](int, size_t) {
            self->onWriteFinished();
            on_done();
        },
        [self, on_error](int, int error) {
            self->onWriteFinished();
            on_error(error);
        });

    if (!job) {
        Logger::getInstance().logError("SocketWriter: WriteJob pool exhausted for fd=" + std::to_string(fd_));
        on_error(ENOMEM);
        return;
    }
    ++pending_writes_;
    job->start(loop_);
}

void SocketWriter::close() {
    if (closing_) {
        return;
    }
    closing_ = true;
    if (pending_writes_ == 0) {
        release();
    }
}

void SocketWriter::onWriteFinished() {
    --pending_writes_;
    if (closing_ && pending_writes_ == 0) {
        release();
    }
}

void SocketWriter::release() {
    if (fd_ < 0) {
        return;
    }
    ::close(fd_);
    fd_ = -1;
}

} // namespace trellis
