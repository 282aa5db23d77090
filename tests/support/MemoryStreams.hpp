#pragma once

#include "trellis/io/BufferedReader.hpp"
#include "trellis/io/StreamWriter.hpp"
#include <cerrno>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace trellis::testing {

/**
 * Reader over a fixed list of chunks, each delivered by one fillBuffer()
 * call. After the last chunk it reports end-of-stream, or `fail_with` when
 * that is non-zero.
 */
class ScriptedReader : public BufferedReader {
  public:
    explicit ScriptedReader(std::vector<std::string> chunks, int fail_with = 0)
        : chunks_(chunks.begin(), chunks.end()), fail_with_(fail_with) {}

    static std::shared_ptr<ScriptedReader> of(std::string data) {
        return std::make_shared<ScriptedReader>(std::vector<std::string>{std::move(data)});
    }

    // Bytes never handed to the buffered reader
    std::string unread() const {
        std::string rest;
        for (const auto& chunk : chunks_) {
            rest += chunk;
        }
        return rest;
    }

    size_t fills() const { return fills_; }

  protected:
    void fillBuffer(FillCallback on_data, ErrorCallback on_error) override {
        ++fills_;
        if (chunks_.empty()) {
            if (fail_with_ != 0) {
                on_error(fail_with_);
            } else {
                on_data(nullptr, 0);
            }
            return;
        }
        std::string chunk = std::move(chunks_.front());
        chunks_.pop_front();
        on_data(chunk.data(), chunk.size());
    }

  private:
    std::deque<std::string> chunks_;
    int fail_with_;
    size_t fills_ = 0;
};

/**
 * Reader whose fills complete only when the test calls deliver() or
 * finish(), so continuations run after the code that issued the read has
 * returned.
 */
class DeferredReader : public BufferedReader {
  public:
    bool pending() const { return static_cast<bool>(on_data_); }

    void deliver(const std::string& chunk) {
        auto on_data = std::move(on_data_);
        on_data_ = nullptr;
        on_data(chunk.data(), chunk.size());
    }

    void finish() {
        auto on_data = std::move(on_data_);
        on_data_ = nullptr;
        on_data(nullptr, 0);
    }

  protected:
    void fillBuffer(FillCallback on_data, ErrorCallback) override {
        on_data_ = std::move(on_data);
    }

  private:
    FillCallback on_data_;
};

/**
 * Writer that appends everything to a string. Completes writes inline.
 */
class RecordingWriter : public StreamWriter {
  public:
    void write(std::string data, DoneCallback on_done, ErrorCallback on_error) override {
        ++writes_;
        if (closed_) {
            on_error(EBADF);
            return;
        }
        if (fail_with_ != 0) {
            on_error(fail_with_);
            return;
        }
        output_ += data;
        on_done();
    }

    void close() override {
        ++close_calls_;
        closed_ = true;
    }

    bool isClosed() const override { return closed_; }

    void failWrites(int error) { fail_with_ = error; }

    const std::string& output() const { return output_; }
    size_t writes() const { return writes_; }
    int closeCalls() const { return close_calls_; }

  private:
    std::string output_;
    size_t writes_ = 0;
    int close_calls_ = 0;
    bool closed_ = false;
    int fail_with_ = 0;
};

} // namespace trellis::testing
