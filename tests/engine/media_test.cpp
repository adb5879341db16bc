#include <gtest/gtest.h>
#include <peerlink/engine/media.hpp>
#include <peerlink/engine/types.hpp>

#include <memory>

namespace peerlink::engine::test {

// Capture device that counts releases
class CountingTrack : public MediaTrack {
public:
    CountingTrack(std::string id, MediaKind kind) : MediaTrack(std::move(id), kind) {}
    int released = 0;

protected:
    void onStop() override { released++; }
};

TEST(MediaTrackTest, StopIsIdempotent) {
    CountingTrack track("mic", MediaKind::Audio);
    EXPECT_TRUE(track.isEnabled());

    track.stop();
    track.stop();

    EXPECT_TRUE(track.stopped());
    EXPECT_FALSE(track.isEnabled());
    EXPECT_EQ(track.released, 1);
}

TEST(MediaStreamTest, TracksByKind) {
    MediaStream stream("local");
    auto audio = std::make_shared<MediaTrack>("mic", MediaKind::Audio);
    auto video = std::make_shared<MediaTrack>("cam", MediaKind::Video);

    stream.addTrack(audio);
    stream.addTrack(video);
    stream.addTrack(audio);
    stream.addTrack(nullptr);

    EXPECT_EQ(stream.tracks().size(), 2u);
    EXPECT_EQ(stream.audioTracks().size(), 1u);
    EXPECT_EQ(stream.videoTracks().size(), 1u);
    EXPECT_EQ(stream.firstTrack(MediaKind::Video), video);

    EXPECT_TRUE(stream.removeTrack("cam"));
    EXPECT_FALSE(stream.removeTrack("cam"));
    EXPECT_EQ(stream.firstTrack(MediaKind::Video), nullptr);
}

TEST(EngineTypesTest, ParseAndName) {
    EXPECT_EQ(parseDirection("recvonly"), Direction::RecvOnly);
    EXPECT_FALSE(parseDirection("inactive").has_value());
    EXPECT_EQ(parseVideoCodec("H264"), VideoCodec::H264);
    EXPECT_FALSE(parseVideoCodec("AV1").has_value());
    EXPECT_EQ(parseSdpType("answer"), SdpType::Answer);

    EXPECT_STREQ(toString(SignalingState::HaveLocalOffer), "have-local-offer");
    EXPECT_STREQ(toString(IceConnectionState::Completed), "completed");
    EXPECT_STREQ(toString(Direction::SendOnly), "sendonly");
}

} // namespace peerlink::engine::test
