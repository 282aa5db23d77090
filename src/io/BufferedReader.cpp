#include "trellis/io/BufferedReader.hpp"
#include <cerrno>

namespace trellis {

void BufferedReader::readLine(LineCallback on_line, ErrorCallback on_error) {
    size_t eol = buffer_.find('\n');
    if (eol != std::string::npos) {
        if (eol + 1 > max_line_) {
            on_error(EMSGSIZE);
            return;
        }
        std::string line = buffer_.substr(0, eol + 1);
        buffer_.erase(0, eol + 1);
        on_line(std::move(line));
        return;
    }

    if (buffer_.size() > max_line_) {
        on_error(EMSGSIZE);
        return;
    }

    if (eof_) {
        // Unterminated trailing bytes are returned as a final line
        std::string rest;
        rest.swap(buffer_);
        on_line(std::move(rest));
        return;
    }

    fillBuffer(
        [this, on_line = std::move(on_line), on_error](const char* data, size_t len) mutable {
            if (len == 0) {
                eof_ = true;
            } else {
                buffer_.append(data, len);
            }
            readLine(std::move(on_line), std::move(on_error));
        },
        on_error);
}

void BufferedReader::readExactly(size_t n, DataCallback on_data, ErrorCallback on_error) {
    if (buffer_.size() >= n) {
        std::string data = buffer_.substr(0, n);
        buffer_.erase(0, n);
        on_data(std::move(data));
        return;
    }

    if (eof_) {
        on_error(ENODATA);
        return;
    }

    fillBuffer(
        [this, n, on_data = std::move(on_data), on_error](const char* data, size_t len) mutable {
            if (len == 0) {
                eof_ = true;
            } else {
                buffer_.append(data, len);
            }
            readExactly(n, std::move(on_data), std::move(on_error));
        },
        on_error);
}

} // namespace trellis
