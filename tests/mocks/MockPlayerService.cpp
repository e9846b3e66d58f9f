#include "mocks/MockPlayerService.h"
#include <algorithm>
#include <stdexcept>

namespace PSC {
namespace Test {

std::future<CommandResult> MockPlayerService::executeLoadTrack(const std::string &libraryItemId,
                                                               const std::optional<std::string> &) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loadedItems_.push_back(libraryItemId);
    }
    return record("executeLoadTrack");
}

std::future<CommandResult> MockPlayerService::executePlay() {
    return record("executePlay");
}

std::future<CommandResult> MockPlayerService::executePause() {
    return record("executePause");
}

std::future<CommandResult> MockPlayerService::executeStop() {
    return record("executeStop");
}

std::future<CommandResult> MockPlayerService::executeSeek(double position) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        seekPositions_.push_back(position);
    }
    return record("executeSeek");
}

std::future<CommandResult> MockPlayerService::executeSetRate(double) {
    return record("executeSetRate");
}

std::future<CommandResult> MockPlayerService::executeSetVolume(double) {
    return record("executeSetVolume");
}

std::future<CommandResult> MockPlayerService::record(const std::string &command) {
    CommandHook hook;
    bool throwing = false;
    std::optional<std::string> failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(command);
        hook = hook_;
        auto thrown = throwing_.find(command);
        throwing = thrown != throwing_.end() && thrown->second;
        auto failed = failures_.find(command);
        if (failed != failures_.end()) {
            failure = failed->second;
        }
    }

    if (hook) {
        hook(command);
    }

    std::promise<CommandResult> promise;
    if (throwing) {
        promise.set_exception(std::make_exception_ptr(std::runtime_error(command + " threw")));
    } else if (failure) {
        promise.set_value(CommandResult::failure(*failure));
    } else {
        promise.set_value(CommandResult::ok());
    }
    return promise.get_future();
}

std::vector<std::string> MockPlayerService::getCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
}

int MockPlayerService::callCount(const std::string &command) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(std::count(calls_.begin(), calls_.end(), command));
}

std::vector<std::string> MockPlayerService::getLoadedItems() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loadedItems_;
}

std::vector<double> MockPlayerService::getSeekPositions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seekPositions_;
}

void MockPlayerService::clearCalls() {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.clear();
    loadedItems_.clear();
    seekPositions_.clear();
}

void MockPlayerService::setFailure(const std::string &command, const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[command] = message;
}

void MockPlayerService::setThrowing(const std::string &command, bool throwing) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwing_[command] = throwing;
}

void MockPlayerService::setCommandHook(CommandHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    hook_ = std::move(hook);
}

}  // namespace Test
}  // namespace PSC
