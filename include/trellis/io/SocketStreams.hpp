#pragma once

#include "trellis/io/BufferedReader.hpp"
#include "trellis/io/StreamWriter.hpp"
#include <memory>

namespace trellis {

class EventLoop;

/**
 * Reads from a connected socket through RecvJobs on the event loop.
 * Must be held by shared_ptr: a pending recv keeps the reader alive.
 */
class SocketReader : public BufferedReader, public std::enable_shared_from_this<SocketReader> {
public:
    static constexpr size_t RECV_BUFFER_SIZE = 16 * 1024;

    SocketReader(EventLoop& loop, int fd);

    int fd() const { return fd_; }

protected:
    void fillBuffer(FillCallback on_data, ErrorCallback on_error) override;

private:
    EventLoop& loop_;
    int fd_;
    std::unique_ptr<char[]> recv_buffer_;
};

/**
 * Writes to a connected socket through WriteJobs. Owns the descriptor.
 *
 * close() takes effect for callers immediately, but the descriptor itself is
 * released only once no WriteJob still refers to it, so a resubmitted
 * partial send can never land on a reused descriptor number.
 */
class SocketWriter : public StreamWriter, public std::enable_shared_from_this<SocketWriter> {
public:
    SocketWriter(EventLoop& loop, int fd);
    ~SocketWriter() override;

    SocketWriter(const SocketWriter&) = delete;
    SocketWriter& operator=(const SocketWriter&) = delete;

    void write(std::string data, DoneCallback on_done, ErrorCallback on_error) override;
    void close() override;
    bool isClosed() const override { return closing_; }

    // -1 once the descriptor has actually been released
    int fd() const { return fd_; }

private:
    void onWriteFinished();
    void release();

    EventLoop& loop_;
    int fd_;
    size_t pending_writes_ = 0;
    bool closing_ = false;
};

} // namespace trellis
