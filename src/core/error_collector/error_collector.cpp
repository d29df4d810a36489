#include "error_collector.hpp"
#include <algorithm>

namespace shootsync::core {

void ErrorCollector::record(TransferFailure failure) {
    std::lock_guard lock(mutex_);
    failures_.push_back(std::move(failure));
}

std::size_t ErrorCollector::count() const {
    std::lock_guard lock(mutex_);
    return failures_.size();
}

std::vector<TransferFailure> ErrorCollector::drain() {
    std::vector<TransferFailure> out;
    {
        std::lock_guard lock(mutex_);
        out.swap(failures_);
    }
    std::stable_sort(out.begin(), out.end(), [](const TransferFailure& a, const TransferFailure& b) {
        if (a.source_path != b.source_path) return a.source_path < b.source_path;
        return a.destination_id < b.destination_id;
    });
    return out;
}

} // namespace shootsync::core
