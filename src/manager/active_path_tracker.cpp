#include "treewatch/manager/active_path_tracker.h"

#include <algorithm>
#include <chrono>
#include <set>
#include <utility>

#include "treewatch/common/path_utils.h"

namespace treewatch {

ActiveClaim::ActiveClaim(std::vector<std::filesystem::path> paths)
    : paths_(std::move(paths)), done_(promise_.get_future().share()) {
}

bool ActiveClaim::IsDone() const {
    return done_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void ActiveClaim::Wait() const {
    done_.wait();
}

std::shared_ptr<ActiveClaim> ActivePathTracker::Claim(const std::filesystem::path& path) {
    return Claim(std::vector<std::filesystem::path>{path});
}

std::shared_ptr<ActiveClaim> ActivePathTracker::Claim(const std::vector<std::filesystem::path>& paths) {
    auto claim = std::make_shared<ActiveClaim>(paths);
    std::vector<std::shared_ptr<ActiveClaim>> blockers;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::set<const ActiveClaim*> seen;
        for (auto it = active_.begin(); it != active_.end(); ) {
            std::shared_ptr<ActiveClaim>& holder = it->second;
            if (holder->IsDone()) {
                it = active_.erase(it);
                continue;
            }

            const std::filesystem::path& active_path = it->first;
            bool overlaps = std::any_of(paths.begin(), paths.end(), [&](const std::filesystem::path& p) {
                return PathsOverlap(p, active_path);
            });
            if (overlaps) {
                if (seen.insert(holder.get()).second) {
                    blockers.push_back(holder);
                }
                // Later claims on this path now queue behind the new claim,
                // which itself runs only after `holder` is done.
                holder = claim;
            }
            ++it;
        }
        for (const std::filesystem::path& p : paths) {
            active_[p] = claim;
        }
    }

    for (const auto& blocker : blockers) {
        blocker->Wait();
    }
    return claim;
}

void ActivePathTracker::Release(const std::shared_ptr<ActiveClaim>& claim) {
    if (!claim) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (claim->released_) {
        return;
    }
    claim->released_ = true;
    claim->promise_.set_value();

    for (auto it = active_.begin(); it != active_.end(); ) {
        if (it->second == claim) {
            it = active_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t ActivePathTracker::active_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

}  // namespace treewatch
