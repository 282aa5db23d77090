#include "trellis/http/StaticResources.hpp"
#include "trellis/Config.hpp"
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace trellis {

namespace {

constexpr size_t SEND_CHUNK_SIZE = 16 * 1024;

class FileResourceStream : public ResourceStream {
  public:
    explicit FileResourceStream(int fd) : fd_(fd) {}
    ~FileResourceStream() override {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FileResourceStream(const FileResourceStream&) = delete;
    FileResourceStream& operator=(const FileResourceStream&) = delete;

    ssize_t read(char* buffer, size_t capacity) override {
        ssize_t n;
        do {
            n = ::read(fd_, buffer, capacity);
        } while (n < 0 && errno == EINTR);
        return n < 0 ? -errno : n;
    }

  private:
    int fd_;
};

/**
 * Read a chunk, write it, repeat. Each write is a suspension point; the
 * transfer keeps itself alive through the write continuations.
 */
class ResourceTransfer : public std::enable_shared_from_this<ResourceTransfer> {
  public:
    ResourceTransfer(WriterPtr writer, std::shared_ptr<ResourceStream> stream, HandlerDone done)
        : writer_(std::move(writer))
        , stream_(std::move(stream))
        , done_(std::move(done))
        , chunk_(std::make_unique<char[]>(SEND_CHUNK_SIZE)) {}

    void pump() {
        ssize_t n = stream_->read(chunk_.get(), SEND_CHUNK_SIZE);
        if (n < 0) {
            done_(HandlerResult::failure(ErrorKind::ResourceIOError, "reading resource", static_cast<int>(-n)));
            return;
        }
        if (n == 0) {
            done_(HandlerResult::close());
            return;
        }

        auto self = shared_from_this();
        writer_->write(std::string(chunk_.get(), static_cast<size_t>(n)),
            [self]() { self->pump(); },
            [self](int error) {
                self->done_(HandlerResult::failure(ErrorKind::WriteFailure, "streaming resource", error));
            });
    }

  private:
    WriterPtr writer_;
    std::shared_ptr<ResourceStream> stream_;
    HandlerDone done_;
    std::unique_ptr<char[]> chunk_;
};

bool endsWith(std::string_view name, std::string_view suffix) {
    return name.size() >= suffix.size() && name.substr(name.size() - suffix.size()) == suffix;
}

} // namespace

FileSystemResourceProvider::FileSystemResourceProvider(std::string root)
    : root_(std::move(root)) {
    if (root_.empty()) {
        root_ = ".";
    }
}

OpenedResource FileSystemResourceProvider::open(const std::string& bundle, const std::string& relpath) {
    std::string full_path = root_;
    if (!bundle.empty()) {
        full_path += "/";
        full_path += bundle;
    }
    full_path += "/";
    full_path += relpath;

    int fd = ::open(full_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int error = errno == ENOTDIR ? ENOENT : errno;
        TRELLIS_DEBUG_LOG("FileSystemResourceProvider: cannot open " << full_path << " errno=" << error);
        return OpenedResource{nullptr, error};
    }

    struct stat st;
    if (fstat(fd, &st) < 0) {
        int error = errno;
        ::close(fd);
        return OpenedResource{nullptr, error};
    }
    if (S_ISDIR(st.st_mode)) {
        ::close(fd);
        return OpenedResource{nullptr, EISDIR};
    }

    return OpenedResource{std::make_unique<FileResourceStream>(fd), 0};
}

std::string getMimeType(std::string_view name) {
    if (endsWith(name, ".html")) {
        return "text/html";
    }
    if (endsWith(name, ".css")) {
        return "text/css";
    }
    if (endsWith(name, ".png") || endsWith(name, ".jpg")) {
        return "image";
    }
    return "text/plain";
}

void streamResource(const WriterPtr& writer, std::shared_ptr<ResourceStream> stream, HandlerDone done) {
    auto transfer = std::make_shared<ResourceTransfer>(writer, std::move(stream), std::move(done));
    transfer->pump();
}

} // namespace trellis
