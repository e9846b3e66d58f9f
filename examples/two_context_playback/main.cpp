// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "events/InProcessNativeHub.h"
#include "events/NativeBridgeIntegrator.h"
#include "events/PlayerEventBus.h"
#include "runtime/PlayerStateCoordinator.h"
#include <iostream>
#include <memory>
#include <string>

using namespace PSC;

// Player service that only reports what it was asked to do
class ConsolePlayerService : public IPlayerService {
public:
    explicit ConsolePlayerService(std::string label) : label_(std::move(label)) {}

    std::future<CommandResult> executeLoadTrack(const std::string &libraryItemId,
                                                const std::optional<std::string> &) override {
        return complete("load " + libraryItemId);
    }

    std::future<CommandResult> executePlay() override {
        return complete("play");
    }

    std::future<CommandResult> executePause() override {
        return complete("pause");
    }

    std::future<CommandResult> executeStop() override {
        return complete("stop");
    }

    std::future<CommandResult> executeSeek(double position) override {
        return complete(std::format("seek to {:.1f}s", position));
    }

    std::future<CommandResult> executeSetRate(double rate) override {
        return complete(std::format("rate {:.2f}", rate));
    }

    std::future<CommandResult> executeSetVolume(double volume) override {
        return complete(std::format("volume {:.2f}", volume));
    }

private:
    std::future<CommandResult> complete(const std::string &action) {
        std::cout << "   [" << label_ << "] native player: " << action << std::endl;
        std::promise<CommandResult> done;
        done.set_value(CommandResult::ok());
        return done.get_future();
    }

    std::string label_;
};

// One isolated execution context: its own bus, bridge and coordinator
struct PlaybackContext {
    PlaybackContext(InProcessNativeHub &hub, const RuntimeContext &runtime)
        : bus(std::make_shared<PlayerEventBus>()),
          bridge(std::make_unique<NativeBridgeIntegrator>(bus, hub.createEndpoint(), runtime)),
          coordinator(std::make_unique<PlayerStateCoordinator>(
              PlayerStateCoordinator::Dependencies{std::make_shared<ConsolePlayerService>(runtime.label()), nullptr,
                                                   {}},
              runtime)) {
        coordinator->attachToEventBus(bus);
        bridge->initialize();
    }

    ~PlaybackContext() {
        bridge->cleanup();
        coordinator->shutdown();
    }

    std::shared_ptr<PlayerEventBus> bus;
    std::unique_ptr<NativeBridgeIntegrator> bridge;
    std::unique_ptr<PlayerStateCoordinator> coordinator;
};

static void settle(PlaybackContext &ui, PlaybackContext &headless) {
    for (int round = 0; round < 2; ++round) {
        ui.coordinator->waitUntilIdle();
        headless.coordinator->waitUntilIdle();
    }
}

static void printStates(PlaybackContext &ui, PlaybackContext &headless) {
    std::cout << "   UI: " << toString(ui.coordinator->getState())
              << ", HEADLESS: " << toString(headless.coordinator->getState()) << std::endl;
    std::cout << std::endl;
}

int main() {
    Logger::initialize();
    Logger::setLevel(LogLevel::Warn);

    std::cout << "=== PSC Two-Context Playback Example ===" << std::endl;
    std::cout << std::endl;

    InProcessNativeHub hub;
    PlaybackContext ui(hub, RuntimeContext::foreground());
    PlaybackContext headless(hub, RuntimeContext::headless());
    headless.coordinator->setObserverMode(true);

    std::cout << "1. UI loads a book" << std::endl;
    ui.bus->dispatch(Evt::LoadTrack{"li-demo", std::nullopt});
    settle(ui, headless);
    printStates(ui, headless);

    std::cout << "2. Native player reports the queue is ready" << std::endl;
    headless.bus->dispatch(Evt::QueueReloaded{0.0});
    settle(ui, headless);
    printStates(ui, headless);

    std::cout << "3. Lock screen presses play" << std::endl;
    headless.bus->dispatch(Evt::Play{});
    settle(ui, headless);
    printStates(ui, headless);

    std::cout << "4. UI seeks to 15:00" << std::endl;
    ui.bus->dispatch(Evt::Seek{900.0});
    settle(ui, headless);
    printStates(ui, headless);

    std::cout << "5. Native progress confirms the seek" << std::endl;
    headless.bus->dispatch(Evt::NativeProgressUpdated{900.0, 3600.0, std::nullopt});
    settle(ui, headless);
    printStates(ui, headless);

    std::cout << "6. UI stops playback" << std::endl;
    ui.bus->dispatch(Evt::Stop{});
    settle(ui, headless);
    headless.bus->dispatch(Evt::NativeStateChanged{NativePlaybackState::Stopped});
    settle(ui, headless);
    printStates(ui, headless);

    auto stats = ui.bridge->getStats();
    std::cout << "UI bridge: forwarded=" << stats.forwarded << " received=" << stats.received
              << " echoesDropped=" << stats.echoesDropped << std::endl;
    std::cout << "UI metrics:" << std::endl;
    std::cout << JsonUtils::toPrettyString(ui.coordinator->exportDiagnosticsJson()["metrics"]) << std::endl;
    std::cout << std::endl;

    std::cout << "=== Example Complete ===" << std::endl;
    return 0;
}
