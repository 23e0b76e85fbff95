#include "fault/fault_injector.h"

#include "storage/repository.h"

namespace larder {

const char* to_string(FaultType type) {
    switch (type) {
        case FaultType::FETCH_ERROR:  return "FetchError";
        case FaultType::UPSERT_ERROR: return "UpsertError";
    }
    return "FetchError";
}

void FaultInjector::inject(const std::string& key, FaultType type, FaultParameters params) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActiveFault fault;
    fault.remaining = params.fail_count;
    fault.params = std::move(params);
    faults_[slot(key, type)] = fault;
}

void FaultInjector::clear(const std::string& key, FaultType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    faults_.erase(slot(key, type));
}

void FaultInjector::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    faults_.clear();
}

void FaultInjector::check(const std::string& key, FaultType type) {
    std::string message;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = faults_.find(slot(key, type));
        if (it == faults_.end()) {
            return;
        }

        auto& fault = it->second;
        message = fault.params.message;
        if (fault.remaining > 0 && --fault.remaining == 0) {
            faults_.erase(it);
        }
        ++triggered_;
    }
    throw RepositoryError(message + " (" + to_string(type) + " " + key + ")");
}

bool FaultInjector::has_fault(const std::string& key, FaultType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return faults_.find(slot(key, type)) != faults_.end();
}

int FaultInjector::triggered_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return triggered_;
}

std::string FaultInjector::slot(const std::string& key, FaultType type) {
    return std::string(to_string(type)) + ":" + key;
}

} // namespace larder
