#pragma once

#include "trellis/io/StreamReader.hpp"
#include <string>

namespace trellis {

/**
 * Line and exact-count framing on top of an abstract byte source.
 * Subclasses only implement fillBuffer(); everything already buffered is
 * served without suspending.
 */
class BufferedReader : public StreamReader {
public:
    static constexpr size_t DEFAULT_MAX_LINE = 64 * 1024;

    void readLine(LineCallback on_line, ErrorCallback on_error) override;
    void readExactly(size_t n, DataCallback on_data, ErrorCallback on_error) override;

    /**
     * Lines longer than this (terminator included) fail with EMSGSIZE
     * instead of growing the buffer without bound.
     */
    void setMaxLineLength(size_t max_line) { max_line_ = max_line; }
    size_t maxLineLength() const { return max_line_; }

    // Bytes received but not yet handed out
    size_t buffered() const { return buffer_.size(); }

protected:
    using FillCallback = std::function<void(const char* data, size_t len)>;

    /**
     * Obtain more bytes. len == 0 signals end-of-stream.
     */
    virtual void fillBuffer(FillCallback on_data, ErrorCallback on_error) = 0;

private:
    std::string buffer_;
    bool eof_ = false;
    size_t max_line_ = DEFAULT_MAX_LINE;
};

} // namespace trellis
