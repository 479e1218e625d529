#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "sandbox/remote_client.hpp"

namespace threatweaver::sandbox {

class SandboxHandle {
public:
    SandboxHandle(SandboxSession session, std::string scan_id);

    const SandboxSession& Session() const { return session_; }
    const std::string& RemoteId() const { return session_.sandbox_id; }
    const std::string& ScanId() const { return scan_id_; }
    std::chrono::system_clock::time_point CreatedAt() const { return created_at_; }

    // Returns true exactly once; the caller that wins issues the kill.
    bool ClaimTeardown() { return !torn_down_.exchange(true); }
    bool IsTornDown() const { return torn_down_.load(); }

private:
    SandboxSession session_;
    std::string scan_id_;
    std::chrono::system_clock::time_point created_at_;
    std::atomic<bool> torn_down_{false};
};

class ActiveSandboxRegistry {
public:
    // Returns the handle that was displaced, if any.
    std::shared_ptr<SandboxHandle> Insert(std::shared_ptr<SandboxHandle> handle);
    // Removes the entry only while it still refers to `handle`.
    bool Remove(const std::string& scan_id, const std::shared_ptr<SandboxHandle>& handle);
    std::shared_ptr<SandboxHandle> Take(const std::string& scan_id);
    std::shared_ptr<SandboxHandle> Get(const std::string& scan_id) const;
    bool Contains(const std::string& scan_id) const;
    std::size_t Size() const;

private:
    std::unordered_map<std::string, std::shared_ptr<SandboxHandle>> handles_;
    mutable std::mutex mutex_;
};

}  // namespace threatweaver::sandbox
