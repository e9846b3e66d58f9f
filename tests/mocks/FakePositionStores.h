#pragma once

#include "runtime/IPositionSources.h"
#include <map>
#include <mutex>
#include <stdexcept>

namespace PSC {
namespace Test {

/**
 * @brief In-memory durable stores for position resolution tests
 *
 * Each fake can be switched to throwing to simulate a failed database read.
 */
class FakeListeningSessionStore : public IListeningSessionStore {
public:
    std::optional<ActiveSessionRecord> getActiveSession(const std::string &, const std::string &) override {
        if (failing) {
            throw std::runtime_error("session table unavailable");
        }
        ++lookups;
        return session;
    }

    std::optional<ActiveSessionRecord> session;
    bool failing = false;
    int lookups = 0;
};

class FakeMediaProgressStore : public IMediaProgressStore {
public:
    std::optional<SavedProgressRecord> getMediaProgress(const std::string &, const std::string &) override {
        if (failing) {
            throw std::runtime_error("progress table unavailable");
        }
        ++lookups;
        return progress;
    }

    std::optional<SavedProgressRecord> progress;
    bool failing = false;
    int lookups = 0;
};

class FakePersistedPositionStore : public IPersistedPositionStore {
public:
    std::optional<double> get(const std::string &key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failingReads) {
            throw std::runtime_error("storage read failed");
        }
        auto found = values_.find(key);
        return found == values_.end() ? std::nullopt : std::optional<double>(found->second);
    }

    void set(const std::string &key, double value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
        ++writes;
    }

    void remove(const std::string &key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.erase(key);
        ++removals;
    }

    std::optional<double> peek(const std::string &key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = values_.find(key);
        return found == values_.end() ? std::nullopt : std::optional<double>(found->second);
    }

    void seed(const std::string &key, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    bool failingReads = false;
    int writes = 0;
    int removals = 0;

private:
    mutable std::mutex mutex_;
    std::map<std::string, double> values_;
};

class FakeUserIdentityProvider : public IUserIdentityProvider {
public:
    std::optional<std::string> currentUserId() override {
        if (failing) {
            throw std::runtime_error("keychain locked");
        }
        return userId;
    }

    std::optional<std::string> userId = std::string("user-1");
    bool failing = false;
};

}  // namespace Test
}  // namespace PSC
