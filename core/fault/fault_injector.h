#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

namespace larder {

enum class FaultType {
    FETCH_ERROR,   // raw intake fetch for a day fails
    UPSERT_ERROR   // summary upsert for a period key fails
};

const char* to_string(FaultType type);

struct FaultParameters {
    int fail_count = -1;        // -1 = fail every time
    std::string message = "injected repository failure";
};

// Keyed failure switchboard shared by the faulty repository decorators. Keys
// are period keys: "2024-01-05", "2024-W01", "2024-01".
class FaultInjector {
public:
    void inject(const std::string& key, FaultType type, FaultParameters params = {});
    void clear(const std::string& key, FaultType type);
    void clear_all();

    // Throws RepositoryError when an active fault matches. A fault with a
    // fail count clears itself once exhausted.
    void check(const std::string& key, FaultType type);

    bool has_fault(const std::string& key, FaultType type) const;
    int triggered_count() const;

private:
    struct ActiveFault {
        FaultParameters params;
        int remaining = -1;
    };

    static std::string slot(const std::string& key, FaultType type);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ActiveFault> faults_;
    int triggered_ = 0;
};

} // namespace larder
