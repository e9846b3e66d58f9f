// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "runtime/PlayerStateCoordinator.h"
#include "common/Logger.h"
#include "core/TransitionTable.h"
#include "model/ModelJson.h"
#include <algorithm>
#include <numeric>

namespace PSC {

thread_local const PlayerStateCoordinator *PlayerStateCoordinator::executingCommandFor_ = nullptr;

namespace {

double elapsedMs(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
}

/**
 * @brief Marks the current thread as running a Player Service command
 */
class CommandScope {
public:
    CommandScope(const PlayerStateCoordinator *&slot, const PlayerStateCoordinator *owner)
        : slot_(slot), previous_(slot) {
        slot_ = owner;
    }

    ~CommandScope() {
        slot_ = previous_;
    }

private:
    const PlayerStateCoordinator *&slot_;
    const PlayerStateCoordinator *previous_;
};

}  // namespace

PlayerStateCoordinator::PlayerStateCoordinator(Dependencies dependencies, const RuntimeContext &runtime,
                                               const CoordinatorConfig &config)
    : runtime_(runtime), playerService_(std::move(dependencies.playerService)),
      storeBridge_(std::move(dependencies.storeBridge)),
      positionResolver_(std::move(dependencies.positionSources), config), observerMode_(config.observerMode),
      transitionHistory_(config.historyCapacity), processingTimes_(config.processingTimeWindow) {
    if (!playerService_) {
        throw std::invalid_argument("PlayerStateCoordinator requires a player service");
    }

    workerThread_ = std::thread(&PlayerStateCoordinator::eventProcessingWorker, this);

    LOG_INFO("Coordinator started in {} context ({} mode)", runtime_.label(),
             observerMode_.load() ? "observer" : "execution");
}

PlayerStateCoordinator::~PlayerStateCoordinator() {
    shutdown();
}

void PlayerStateCoordinator::dispatch(const PlayerEvent &event) {
    if (executingCommandFor_ == this) {
        ++reentrantDispatchCount_;
        LOG_ERROR("{} dispatched from inside a player service command; commands must not dispatch", event.name());
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (shutdownRequested_) {
            LOG_WARN("Coordinator is shut down, dropping {}", event.name());
            return;
        }
        eventQueue_.push_back(event);
    }
    queueCondition_.notify_one();
}

void PlayerStateCoordinator::eventProcessingWorker() {
    LOG_DEBUG("Worker thread started");

    std::unique_lock<std::mutex> lock(queueMutex_);
    while (true) {
        queueCondition_.wait(lock, [this] { return shutdownRequested_ || !eventQueue_.empty(); });
        if (shutdownRequested_) {
            break;
        }

        PlayerEvent event = std::move(eventQueue_.front());
        eventQueue_.pop_front();
        processing_ = true;

        // Producers keep enqueueing while this event runs
        lock.unlock();

        try {
            processEvent(event);
        } catch (const std::exception &e) {
            LOG_ERROR("Error processing {}: {}", event.name(), e.what());
            {
                std::lock_guard<std::mutex> stateLock(stateMutex_);
                ++metrics_.processingErrorCount;
            }
            notifyProcessingError(event, e.what());
        }

        lock.lock();
        processing_ = false;
        if (eventQueue_.empty()) {
            idleCondition_.notify_all();
        }
    }

    processing_ = false;
    idleCondition_.notify_all();
    LOG_DEBUG("Worker thread stopped");
}

void PlayerStateCoordinator::processEvent(const PlayerEvent &event) {
    std::lock_guard<std::mutex> transitionLock(transitionMutex_);

    const auto started = std::chrono::steady_clock::now();
    const TimestampMs timestamp = currentTimestampMs();

    StateContext context = getContext();
    const PlayerState currentState = context.currentState;

    const TransitionValidation validation = TransitionTable::validate(currentState, event);

    // Payload fields are applied even for rejected events so the context keeps
    // tracking what native reports
    updateContextFromEvent(context, event);

    const bool stateChanged = validation.allowed && validation.nextState && *validation.nextState != currentState;
    if (stateChanged) {
        context.previousState = currentState;
        context.currentState = *validation.nextState;
    }

    {
        std::lock_guard<std::mutex> stateLock(stateMutex_);
        context_ = context;
        if (event.is<Evt::PositionReconciled>()) {
            ++metrics_.positionReconciliationCount;
        }
        if (stateChanged) {
            ++metrics_.stateTransitionCount;
        }
        if (!validation.allowed) {
            ++metrics_.rejectedTransitionCount;
        }
        transitionHistory_.push(TransitionHistoryEntry{timestamp, event, currentState, validation.nextState,
                                                       validation.allowed, validation.reason, elapsedMs(started)});
    }

    notifyDiagnostic(
        DiagnosticEvent{timestamp, event, currentState, validation.nextState, validation.allowed, context});

    if (validation.allowed) {
        if (stateChanged) {
            LOG_INFO("Transition: {} --[{}]--> {}", toString(currentState), event.name(),
                     toString(*validation.nextState));
        } else {
            LOG_DEBUG("Accepted {} in {}", event.name(), toString(currentState));
        }

        if (!observerMode_.load()) {
            executeTransition(event, currentState, *validation.nextState);

            if (event.is<Evt::NativeProgressUpdated>()) {
                syncPositionToStore(getContext());
            } else {
                syncStateToStore(getContext());
            }
        }
    } else {
        LOG_WARN("Rejected: {} --[{}]--> reason: {}", toString(currentState), event.name(),
                 validation.reason.value_or("unknown"));
    }

    const double processingTime = elapsedMs(started);
    {
        std::lock_guard<std::mutex> stateLock(stateMutex_);
        processingTimes_.push(processingTime);
        const auto samples = processingTimes_.snapshot();
        metrics_.avgEventProcessingTime =
            std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(samples.size());
        ++metrics_.totalEventsProcessed;
        metrics_.lastEventTimestamp = timestamp;
    }

    notifyEventProcessed(event, EventProcessingResult{true, stateChanged, currentState,
                                                      validation.nextState.value_or(currentState), std::nullopt,
                                                      processingTime});
}

void PlayerStateCoordinator::updateContextFromEvent(StateContext &context, const PlayerEvent &event) const {
    switch (event.type()) {
    case PlayerEventType::RESTORE_STATE: {
        const auto &state = event.get<Evt::RestoreState>()->state;
        context.currentTrack = state.currentTrack;
        context.position = state.position;
        context.playbackRate = state.playbackRate;
        context.volume = state.volume;
        context.isPlaying = state.isPlaying;
        context.sessionId = state.currentPlaySessionId;
        if (state.currentTrack) {
            context.duration = state.currentTrack->duration;
        }
        LOG_DEBUG("Context restored: position={:.1f}s, track={}", state.position,
                  state.currentTrack ? state.currentTrack->title : "none");
        break;
    }

    case PlayerEventType::LOAD_TRACK:
        context.isLoadingTrack = true;
        break;

    case PlayerEventType::NATIVE_TRACK_CHANGED: {
        const auto &track = event.get<Evt::NativeTrackChanged>()->track;
        context.currentTrack = track;
        if (track) {
            context.duration = track->duration;
        }
        break;
    }

    case PlayerEventType::QUEUE_RELOADED:
        context.isLoadingTrack = false;
        context.position = event.get<Evt::QueueReloaded>()->position;
        break;

    case PlayerEventType::NATIVE_PROGRESS_UPDATED: {
        const auto *progress = event.get<Evt::NativeProgressUpdated>();
        context.isSeeking = false;
        context.duration = progress->duration;
        context.lastPositionUpdate = currentTimestampMs();
        // Right after a queue load native reports 0 before seeking to the
        // resume point; keep the resolved position until the load completes
        if (context.isLoadingTrack && progress->position == 0.0) {
            break;
        }
        context.position = progress->position;
        break;
    }

    case PlayerEventType::SEEK:
        // A rejected repeat seek must not replace the state the first seek interrupted
        if (context.currentState != PlayerState::SEEKING) {
            context.preSeekState = context.currentState;
        }
        context.isSeeking = true;
        context.position = event.get<Evt::Seek>()->position;
        break;

    case PlayerEventType::SEEK_COMPLETE:
        context.isSeeking = false;
        break;

    case PlayerEventType::POSITION_RECONCILED:
        context.position = event.get<Evt::PositionReconciled>()->position;
        LOG_DEBUG("Position reconciled to {:.1f}s", context.position);
        break;

    case PlayerEventType::PLAY:
        context.isPlaying = true;
        break;

    case PlayerEventType::PAUSE:
        context.isPlaying = false;
        break;

    case PlayerEventType::STOP:
        context.isPlaying = false;
        context.isLoadingTrack = false;
        context.position = 0.0;
        context.currentTrack.reset();
        context.sessionId.reset();
        context.sessionStartTime.reset();
        break;

    case PlayerEventType::SET_RATE:
        context.playbackRate = event.get<Evt::SetRate>()->rate;
        break;

    case PlayerEventType::SET_VOLUME:
        context.volume = event.get<Evt::SetVolume>()->volume;
        break;

    case PlayerEventType::BUFFERING_STARTED:
        context.isBuffering = true;
        break;

    case PlayerEventType::BUFFERING_COMPLETED:
        context.isBuffering = false;
        break;

    case PlayerEventType::SESSION_CREATED:
        context.sessionId = event.get<Evt::SessionCreated>()->sessionId;
        context.sessionStartTime = currentTimestampMs();
        LOG_DEBUG("Session created: {}", *context.sessionId);
        break;

    case PlayerEventType::SESSION_UPDATED:
        context.pendingSyncPosition.reset();
        break;

    case PlayerEventType::SESSION_ENDED:
        context.sessionId.reset();
        context.sessionStartTime.reset();
        break;

    case PlayerEventType::SESSION_SYNC_COMPLETED:
        context.lastServerSync = currentTimestampMs();
        break;

    case PlayerEventType::CHAPTER_CHANGED:
        context.currentChapter = event.get<Evt::ChapterChanged>()->chapter;
        break;

    case PlayerEventType::NATIVE_STATE_CHANGED: {
        const auto state = event.get<Evt::NativeStateChanged>()->state;
        context.isPlaying = state == NativePlaybackState::Playing;
        LOG_DEBUG("Native state {}: isPlaying={}", toString(state), context.isPlaying);
        break;
    }

    case PlayerEventType::NATIVE_ERROR:
        context.lastError = event.get<Evt::NativeError>()->error;
        break;

    case PlayerEventType::NATIVE_PLAYBACK_ERROR: {
        const auto *failure = event.get<Evt::NativePlaybackError>();
        context.lastError = PlayerError{failure->code, failure->message};
        break;
    }

    case PlayerEventType::SESSION_SYNC_FAILED:
        context.lastError = event.get<Evt::SessionSyncFailed>()->error;
        break;

    case PlayerEventType::RELOAD_QUEUE:
    case PlayerEventType::SESSION_SYNC_STARTED:
    case PlayerEventType::APP_FOREGROUNDED:
    case PlayerEventType::APP_BACKGROUNDED:
        break;
    }
}

void PlayerStateCoordinator::executeTransition(const PlayerEvent &event, PlayerState fromState,
                                               PlayerState nextState) {
    switch (nextState) {
    case PlayerState::LOADING:
        if (const auto *load = event.get<Evt::LoadTrack>()) {
            runCommand("executeLoadTrack",
                       [&] { return playerService_->executeLoadTrack(load->libraryItemId, load->episodeId); });
        }
        break;

    case PlayerState::READY:
        if (fromState == PlayerState::SEEKING) {
            bool resume = false;
            {
                std::lock_guard<std::mutex> stateLock(stateMutex_);
                resume = context_.preSeekState == PlayerState::PLAYING;
                context_.preSeekState.reset();
            }
            if (resume) {
                LOG_INFO("Seek interrupted playback, resuming");
                selfDispatch(Evt::Play{});
            }
        }
        break;

    case PlayerState::PLAYING:
        // Same-state acceptances such as SET_RATE while PLAYING must not call play()
        if (event.is<Evt::Play>()) {
            runCommand("executePlay", [this] { return playerService_->executePlay(); });
        }
        break;

    case PlayerState::PAUSED:
        if (event.is<Evt::Pause>()) {
            runCommand("executePause", [this] { return playerService_->executePause(); });
        }
        break;

    case PlayerState::STOPPING:
    case PlayerState::IDLE:
        if (event.is<Evt::Stop>()) {
            runCommand("executeStop", [this] { return playerService_->executeStop(); });
        }
        break;

    case PlayerState::SEEKING:
    case PlayerState::BUFFERING:
    case PlayerState::ERROR:
        break;
    }

    // Context-mutating commands run whether or not the state changed
    if (const auto *seek = event.get<Evt::Seek>()) {
        runCommand("executeSeek", [&] { return playerService_->executeSeek(seek->position); });
    } else if (const auto *rate = event.get<Evt::SetRate>()) {
        runCommand("executeSetRate", [&] { return playerService_->executeSetRate(rate->rate); });
    } else if (const auto *volume = event.get<Evt::SetVolume>()) {
        runCommand("executeSetVolume", [&] { return playerService_->executeSetVolume(volume->volume); });
    }
}

void PlayerStateCoordinator::runCommand(const char *command,
                                        const std::function<std::future<CommandResult>()> &issue) {
    std::optional<std::string> failure;
    {
        CommandScope scope(executingCommandFor_, this);
        try {
            std::future<CommandResult> pending = issue();
            if (!pending.valid()) {
                failure = "no result";
            } else {
                CommandResult result = pending.get();
                if (!result.success) {
                    failure = result.errorMessage;
                }
            }
        } catch (const std::exception &e) {
            failure = e.what();
        }
    }

    if (failure) {
        LOG_ERROR("{} failed: {}", command, *failure);
        std::lock_guard<std::mutex> stateLock(stateMutex_);
        ++metrics_.sideEffectFailureCount;
    }
}

void PlayerStateCoordinator::selfDispatch(const PlayerEvent &event) {
    std::shared_ptr<PlayerEventBus> eventBus;
    {
        std::lock_guard<std::mutex> lock(busMutex_);
        eventBus = eventBus_;
    }

    if (eventBus) {
        eventBus->dispatch(event);
    } else {
        dispatch(event);
    }
}

void PlayerStateCoordinator::syncPositionToStore(const StateContext &context) {
    if (!storeBridge_) {
        return;
    }
    try {
        storeBridge_->updatePosition(context.position);
        refreshNowPlayingIfChapterChanged(context);
    } catch (const std::exception &e) {
        LOG_DEBUG("Position projection skipped: {}", e.what());
    }
}

void PlayerStateCoordinator::syncStateToStore(const StateContext &context) {
    if (!storeBridge_) {
        return;
    }
    try {
        storeBridge_->setCurrentTrack(context.currentTrack);
        storeBridge_->updatePlayingState(context.isPlaying);
        storeBridge_->updatePosition(context.position);
        storeBridge_->setTrackLoading(context.isLoadingTrack);
        storeBridge_->setSeeking(context.isSeeking);
        storeBridge_->setPlaybackRate(context.playbackRate);
        storeBridge_->setVolume(context.volume);
        storeBridge_->setPlaySessionId(context.sessionId);
        refreshNowPlayingIfChapterChanged(context);
    } catch (const std::exception &e) {
        LOG_DEBUG("State projection skipped: {}", e.what());
    }
}

void PlayerStateCoordinator::refreshNowPlayingIfChapterChanged(const StateContext &context) {
    if (!context.currentChapter || lastSyncedChapterId_ == context.currentChapter->chapter.id) {
        return;
    }
    lastSyncedChapterId_ = context.currentChapter->chapter.id;
    storeBridge_->updateNowPlayingMetadata();
}

PlayerState PlayerStateCoordinator::getState() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return context_.currentState;
}

StateContext PlayerStateCoordinator::getContext() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return context_;
}

CoordinatorMetrics PlayerStateCoordinator::getMetrics() const {
    CoordinatorMetrics metrics;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        metrics = metrics_;
    }
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        metrics.eventQueueLength = eventQueue_.size();
    }
    metrics.reentrantDispatchCount = reentrantDispatchCount_.load();
    return metrics;
}

std::vector<TransitionHistoryEntry> PlayerStateCoordinator::getTransitionHistory() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return transitionHistory_.snapshot();
}

std::vector<PlayerEvent> PlayerStateCoordinator::getEventQueue() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return std::vector<PlayerEvent>(eventQueue_.begin(), eventQueue_.end());
}

std::vector<double> PlayerStateCoordinator::getProcessingTimes() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return processingTimes_.snapshot();
}

CoordinatorDiagnostics PlayerStateCoordinator::exportDiagnostics() const {
    CoordinatorDiagnostics diagnostics;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        diagnostics.context = context_;
        diagnostics.metrics = metrics_;
        diagnostics.processingTimes = processingTimes_.snapshot();
        diagnostics.transitionHistory = transitionHistory_.snapshot();
    }
    diagnostics.eventQueue = getEventQueue();
    diagnostics.metrics.eventQueueLength = diagnostics.eventQueue.size();
    diagnostics.metrics.reentrantDispatchCount = reentrantDispatchCount_.load();
    diagnostics.observerMode = observerMode_.load();
    diagnostics.runtimeContext = runtime_.label();
    return diagnostics;
}

json PlayerStateCoordinator::exportDiagnosticsJson() const {
    return ModelJson::toJson(exportDiagnostics());
}

void PlayerStateCoordinator::setObserverMode(bool enabled) {
    observerMode_.store(enabled);
    LOG_INFO("Coordinator switched to {} mode", enabled ? "observer" : "execution");
}

bool PlayerStateCoordinator::isObserverMode() const {
    return observerMode_.load();
}

void PlayerStateCoordinator::attachToEventBus(const std::shared_ptr<PlayerEventBus> &eventBus) {
    detachFromEventBus();
    if (!eventBus) {
        return;
    }

    std::lock_guard<std::mutex> lock(busMutex_);
    eventBus_ = eventBus;
    unsubscribeBus_ = eventBus->subscribe([this](const PlayerEvent &event) { dispatch(event); });
    LOG_INFO("Coordinator subscribed to player event bus");
}

void PlayerStateCoordinator::detachFromEventBus() {
    PlayerEventBus::Unsubscribe unsubscribe;
    {
        std::lock_guard<std::mutex> lock(busMutex_);
        unsubscribe = std::move(unsubscribeBus_);
        unsubscribeBus_ = nullptr;
        eventBus_.reset();
    }
    if (unsubscribe) {
        unsubscribe();
    }
}

void PlayerStateCoordinator::addObserver(std::shared_ptr<ICoordinatorObserver> observer) {
    if (!observer) {
        return;
    }
    std::lock_guard<std::mutex> lock(observersMutex_);
    observers_.push_back(std::move(observer));
}

void PlayerStateCoordinator::removeObserver(const std::shared_ptr<ICoordinatorObserver> &observer) {
    std::lock_guard<std::mutex> lock(observersMutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

std::future<ResumePositionInfo> PlayerStateCoordinator::resolveCanonicalPosition(const std::string &libraryItemId) {
    return std::async(std::launch::async, [this, libraryItemId] {
        double inMemoryPosition = getContext().position;
        if (storeBridge_) {
            try {
                inMemoryPosition = storeBridge_->getPosition();
            } catch (const std::exception &e) {
                LOG_DEBUG("Store position unavailable, using context position: {}", e.what());
            }
        }

        ResumePositionInfo info = positionResolver_.resolve(libraryItemId, inMemoryPosition);
        selfDispatch(Evt::PositionReconciled{info.position});
        return info;
    });
}

bool PlayerStateCoordinator::waitUntilIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(queueMutex_);
    return idleCondition_.wait_for(lock, timeout, [this] { return eventQueue_.empty() && !processing_; });
}

void PlayerStateCoordinator::shutdown() {
    detachFromEventBus();

    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (shutdownRequested_ && !workerThread_.joinable()) {
            return;
        }
        shutdownRequested_ = true;
        dropped = eventQueue_.size();
        eventQueue_.clear();
    }
    queueCondition_.notify_all();

    if (workerThread_.joinable() && workerThread_.get_id() != std::this_thread::get_id()) {
        workerThread_.join();
    }
    idleCondition_.notify_all();

    LOG_DEBUG("Coordinator shut down, {} queued events discarded", dropped);
}

void PlayerStateCoordinator::notifyDiagnostic(const DiagnosticEvent &diagnostic) {
    for (const auto &observer : observersSnapshot()) {
        try {
            observer->onDiagnostic(diagnostic);
        } catch (const std::exception &e) {
            LOG_ERROR("Observer failed on diagnostic: {}", e.what());
        }
    }
}

void PlayerStateCoordinator::notifyEventProcessed(const PlayerEvent &event, const EventProcessingResult &result) {
    for (const auto &observer : observersSnapshot()) {
        try {
            observer->onEventProcessed(event, result);
        } catch (const std::exception &e) {
            LOG_ERROR("Observer failed on {}: {}", event.name(), e.what());
        }
    }
}

void PlayerStateCoordinator::notifyProcessingError(const PlayerEvent &event, const std::string &message) {
    for (const auto &observer : observersSnapshot()) {
        try {
            observer->onProcessingError(event, message);
        } catch (const std::exception &e) {
            LOG_ERROR("Observer failed on processing error: {}", e.what());
        }
    }
}

std::vector<std::shared_ptr<ICoordinatorObserver>> PlayerStateCoordinator::observersSnapshot() const {
    std::lock_guard<std::mutex> lock(observersMutex_);
    return observers_;
}

}  // namespace PSC
