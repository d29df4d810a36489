#include "directory_cache.hpp"
#include "../layout/layout.hpp"

namespace shootsync::core {

bool DirectoryCache::contains(const std::string& path) const {
    std::lock_guard lock(mutex_);
    return paths_.contains(path);
}

bool DirectoryCache::insert(const std::string& path) {
    std::lock_guard lock(mutex_);
    return paths_.insert(path).second;
}

std::size_t DirectoryCache::size() const {
    std::lock_guard lock(mutex_);
    return paths_.size();
}

std::string NameRegistry::reserve(const std::string& directory, const std::string& file_name) {
    std::lock_guard lock(mutex_);
    auto& used = used_[directory];

    std::string candidate = file_name;
    for (unsigned n = 1; used.contains(candidate); ++n) {
        candidate = layout::numbered_name(file_name, n);
    }
    used.insert(candidate);
    return candidate;
}

} // namespace shootsync::core
