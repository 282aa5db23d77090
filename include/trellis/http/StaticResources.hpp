#pragma once
#include "trellis/http/HttpTypes.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace trellis {

/**
 * Sequential byte source for one resource.
 */
class ResourceStream {
  public:
    virtual ~ResourceStream() = default;

    /**
     * @return Bytes read, 0 at end, or -errno on failure
     */
    virtual ssize_t read(char* buffer, size_t capacity) = 0;
};

struct OpenedResource {
    std::unique_ptr<ResourceStream> stream;
    int error = 0;      // errno when stream is null; ENOENT means not found
};

/**
 * Resource lookup keyed by (bundle identity, relative path).
 */
class ResourceProvider {
  public:
    virtual ~ResourceProvider() = default;
    virtual OpenedResource open(const std::string& bundle, const std::string& relpath) = 0;
};

/**
 * Resolves resources to <root>/<bundle>/<relpath>, or <root>/<relpath> for
 * an empty bundle. The relative path is used as given; callers reject
 * traversal before getting here.
 */
class FileSystemResourceProvider : public ResourceProvider {
  public:
    explicit FileSystemResourceProvider(std::string root);

    OpenedResource open(const std::string& bundle, const std::string& relpath) override;

    const std::string& root() const { return root_; }

  private:
    std::string root_;
};

// .html, .css, .png/.jpg, anything else is text/plain
std::string getMimeType(std::string_view name);

/**
 * Write every remaining byte of `stream` to `writer` in fixed-size chunks,
 * then complete `done` with close(). A read failure completes with
 * ResourceIOError, a write failure with WriteFailure.
 */
void streamResource(const WriterPtr& writer, std::shared_ptr<ResourceStream> stream, HandlerDone done);

} // namespace trellis
