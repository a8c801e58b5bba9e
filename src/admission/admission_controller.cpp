#include "admission/admission_controller.hpp"

#include <algorithm>

namespace runbox::admission {

AdmissionController::AdmissionController(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

bool AdmissionController::TryAdmit() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return held_ < capacity_;
}

bool AdmissionController::TryAcquire() {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    if (held_ >= capacity_) {
        return false;
    }
    ++held_;
    return true;
}

void AdmissionController::Acquire() {
    std::unique_lock<std::mutex> lock(slots_mutex_);
    slots_cv_.wait(lock, [this] { return held_ < capacity_; });
    ++held_;
}

void AdmissionController::Release() {
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        if (held_ > 0) {
            --held_;
        }
    }
    slots_cv_.notify_one();
}

bool AdmissionController::IsIdentityActive(const std::string& identity) const {
    std::lock_guard<std::mutex> lock(identities_mutex_);
    return active_.count(identity) > 0;
}

bool AdmissionController::MarkActive(const std::string& identity) {
    std::lock_guard<std::mutex> lock(identities_mutex_);
    return active_.insert(identity).second;
}

void AdmissionController::MarkInactive(const std::string& identity) {
    std::lock_guard<std::mutex> lock(identities_mutex_);
    active_.erase(identity);
}

std::size_t AdmissionController::HeldSlots() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return held_;
}

std::size_t AdmissionController::ActiveIdentities() const {
    std::lock_guard<std::mutex> lock(identities_mutex_);
    return active_.size();
}

}  // namespace runbox::admission
