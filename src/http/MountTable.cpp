#include "trellis/http/MountTable.hpp"
#include "trellis/http/Application.hpp"
#include <algorithm>

namespace trellis {

void MountTable::add(std::string prefix, std::shared_ptr<Application> app) {
    mounts_.push_back(MountEntry{std::move(prefix), std::move(app)});
    std::stable_sort(mounts_.begin(), mounts_.end(), [](const MountEntry& a, const MountEntry& b) {
        return a.prefix.size() > b.prefix.size();
    });
}

const MountEntry* MountTable::resolve(std::string_view path) const {
    for (const auto& mount : mounts_) {
        if (path.starts_with(mount.prefix)) {
            return &mount;
        }
    }
    return nullptr;
}

} // namespace trellis
