#include "sandbox/sandbox_registry.hpp"

#include <utility>

#include "utils/common.hpp"

namespace threatweaver::sandbox {

SandboxHandle::SandboxHandle(SandboxSession session, std::string scan_id)
    : session_(std::move(session))
    , scan_id_(std::move(scan_id))
    , created_at_(threatweaver::utils::Now()) {}

std::shared_ptr<SandboxHandle> ActiveSandboxRegistry::Insert(std::shared_ptr<SandboxHandle> handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = handles_[handle->ScanId()];
    auto displaced = std::move(slot);
    slot = std::move(handle);
    return displaced;
}

bool ActiveSandboxRegistry::Remove(const std::string& scan_id,
                                   const std::shared_ptr<SandboxHandle>& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(scan_id);
    if (it == handles_.end() || it->second != handle) {
        return false;
    }
    handles_.erase(it);
    return true;
}

std::shared_ptr<SandboxHandle> ActiveSandboxRegistry::Take(const std::string& scan_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(scan_id);
    if (it == handles_.end()) {
        return nullptr;
    }
    auto handle = std::move(it->second);
    handles_.erase(it);
    return handle;
}

std::shared_ptr<SandboxHandle> ActiveSandboxRegistry::Get(const std::string& scan_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(scan_id);
    if (it == handles_.end()) {
        return nullptr;
    }
    return it->second;
}

bool ActiveSandboxRegistry::Contains(const std::string& scan_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.find(scan_id) != handles_.end();
}

std::size_t ActiveSandboxRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

}  // namespace threatweaver::sandbox
