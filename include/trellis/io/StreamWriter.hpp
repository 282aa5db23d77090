#pragma once

#include <functional>
#include <string>

namespace trellis {

/**
 * Output side of a connection. The dispatcher decides when close() is
 * called; buffering is up to the implementation.
 */
class StreamWriter {
public:
    using DoneCallback = std::function<void()>;
    using ErrorCallback = std::function<void(int error)>;

    virtual ~StreamWriter() = default;

    virtual void write(std::string data, DoneCallback on_done, ErrorCallback on_error) = 0;

    // Idempotent
    virtual void close() = 0;

    virtual bool isClosed() const = 0;
};

} // namespace trellis
