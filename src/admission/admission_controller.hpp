#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>

namespace runbox::admission {

// Bounds concurrent sessions and tracks which identities are currently running.
class AdmissionController {
public:
    explicit AdmissionController(std::size_t capacity);

    // Non-blocking check; does not consume a slot.
    bool TryAdmit() const;
    // Takes a slot only if one is free now; check and take happen under one lock.
    bool TryAcquire();
    void Acquire();
    void Release();

    bool IsIdentityActive(const std::string& identity) const;
    // Returns false when the identity was already active.
    bool MarkActive(const std::string& identity);
    void MarkInactive(const std::string& identity);

    std::size_t HeldSlots() const;
    std::size_t Capacity() const { return capacity_; }
    std::size_t ActiveIdentities() const;

private:
    std::size_t capacity_;
    std::size_t held_ = 0;
    mutable std::mutex slots_mutex_;
    std::condition_variable slots_cv_;

    mutable std::mutex identities_mutex_;
    std::unordered_set<std::string> active_;
};

}  // namespace runbox::admission
