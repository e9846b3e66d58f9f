#pragma once

#include "runtime/IStoreBridge.h"
#include <gmock/gmock.h>

namespace PSC {
namespace Test {

class MockStoreBridge : public IStoreBridge {
public:
    MOCK_METHOD(void, updatePosition, (double position), (override));
    MOCK_METHOD(void, updatePlayingState, (bool isPlaying), (override));
    MOCK_METHOD(void, setCurrentTrack, (const std::optional<PlayerTrack> &track), (override));
    MOCK_METHOD(void, setTrackLoading, (bool isLoading), (override));
    MOCK_METHOD(void, setSeeking, (bool isSeeking), (override));
    MOCK_METHOD(void, setPlaybackRate, (double rate), (override));
    MOCK_METHOD(void, setVolume, (double volume), (override));
    MOCK_METHOD(void, setPlaySessionId, (const std::optional<std::string> &sessionId), (override));
    MOCK_METHOD(void, updateNowPlayingMetadata, (), (override));
    MOCK_METHOD(double, getPosition, (), (const, override));
};

}  // namespace Test
}  // namespace PSC
