#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace trellis {

/**
 * Input side of a connection.
 *
 * Every read is a suspension point: the continuation may run inline (data
 * already buffered) or later on the event loop. Exactly one of the two
 * callbacks runs per call, and at most one read is outstanding at a time.
 */
class StreamReader {
public:
    // Line including its terminator; an empty string means end-of-stream
    using LineCallback = std::function<void(std::string line)>;
    using DataCallback = std::function<void(std::string data)>;
    // errno-style code
    using ErrorCallback = std::function<void(int error)>;

    virtual ~StreamReader() = default;

    virtual void readLine(LineCallback on_line, ErrorCallback on_error) = 0;

    /**
     * Read exactly n bytes. Fails with ENODATA if the stream ends first.
     */
    virtual void readExactly(size_t n, DataCallback on_data, ErrorCallback on_error) = 0;
};

} // namespace trellis
