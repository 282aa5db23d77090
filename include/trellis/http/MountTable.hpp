#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace trellis {

class Application;

struct MountEntry {
    std::string prefix;
    std::shared_ptr<Application> app;
};

/**
 * Sub-applications keyed by literal path prefix, kept sorted by descending
 * prefix length so the most specific prefix is found first. Equal-length
 * prefixes keep their mount order.
 */
class MountTable {
  public:
    void add(std::string prefix, std::shared_ptr<Application> app);

    /**
     * @return The longest entry whose prefix is a byte-prefix of `path`,
     *         or nullptr.
     */
    const MountEntry* resolve(std::string_view path) const;

    size_t size() const { return mounts_.size(); }
    bool empty() const { return mounts_.empty(); }
    const MountEntry& at(size_t index) const { return mounts_.at(index); }

    std::vector<MountEntry>::const_iterator begin() const { return mounts_.begin(); }
    std::vector<MountEntry>::const_iterator end() const { return mounts_.end(); }

  private:
    std::vector<MountEntry> mounts_;
};

} // namespace trellis
