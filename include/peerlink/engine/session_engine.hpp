#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <peerlink/core/error.hpp>
#include <peerlink/engine/media.hpp>
#include <peerlink/engine/types.hpp>

namespace peerlink::engine {

// Data channel configuration
struct DataChannelInit {
    bool ordered = true;
    std::optional<int> max_packet_life_time;
    std::optional<int> max_retransmits;
    std::string protocol;
    bool negotiated = false;
    std::optional<int> id;
};

// Data channel handle provided by the session engine. The engine invokes
// the callbacks on the event loop thread and keeps the channel alive while
// a callback runs.
class DataChannel {
public:
    virtual ~DataChannel() = default;

    virtual std::string label() const = 0;
    virtual DataChannelState state() const = 0;

    virtual void send(const DataPayload& payload) = 0;
    virtual void close() = 0;

    // Events
    std::function<void()> onOpen;
    std::function<void()> onClose;
    std::function<void(const std::string&)> onError;
    std::function<void(const DataPayload&)> onMessage;
};

struct EngineConfiguration {
    std::vector<IceServer> ice_servers;
};

struct OfferOptions {
    bool offer_to_receive_audio = true;
    bool offer_to_receive_video = true;
};

struct TransceiverInit {
    Direction direction = Direction::SendRecv;
    std::optional<VideoCodec> preferred_codec;
};

struct TrackEvent {
    std::shared_ptr<MediaTrack> track;
    std::vector<std::string> stream_ids;
};

// Capability interface of the local real-time media/transport engine.
// Asynchronous operations report through their callback, which the engine
// must invoke on the event loop thread and never from inside the call.
class SessionEngine {
public:
    using DescriptionCallback = std::function<void(core::Result<SessionDescription>)>;
    using CompletionCallback = std::function<void(core::Result<void>)>;

    virtual ~SessionEngine() = default;

    // Connection management
    virtual void createOffer(const OfferOptions& options, DescriptionCallback callback) = 0;
    virtual void createAnswer(DescriptionCallback callback) = 0;
    virtual void setLocalDescription(const SessionDescription& description, CompletionCallback callback) = 0;
    virtual void setRemoteDescription(const SessionDescription& description, CompletionCallback callback) = 0;
    virtual std::optional<SessionDescription> localDescription() const = 0;

    // ICE candidates
    virtual void addIceCandidate(const IceCandidate& candidate, CompletionCallback callback) = 0;

    // Media management
    virtual void addTrack(std::shared_ptr<MediaTrack> track,
                          const std::string& stream_id,
                          const TransceiverInit& init) = 0;
    virtual void addTransceiver(MediaKind kind, const TransceiverInit& init) = 0;

    // Data channels
    virtual std::shared_ptr<DataChannel> createDataChannel(const std::string& label,
                                                           const DataChannelInit& init) = 0;

    // Close is asynchronous: signalingState() reports Closed once done.
    virtual void close() = 0;
    virtual SignalingState signalingState() const = 0;
    virtual IceConnectionState iceConnectionState() const = 0;

    // Drop every event callback.
    void detach() {
        onTrack = nullptr;
        onIceCandidate = nullptr;
        onIceConnectionStateChange = nullptr;
        onDataChannel = nullptr;
        onSignalingStateChange = nullptr;
    }

    // Events. onIceCandidate receives std::nullopt at the end of gathering.
    std::function<void(const TrackEvent&)> onTrack;
    std::function<void(const std::optional<IceCandidate>&)> onIceCandidate;
    std::function<void(IceConnectionState)> onIceConnectionStateChange;
    std::function<void(std::shared_ptr<DataChannel>)> onDataChannel;
    std::function<void(SignalingState)> onSignalingStateChange;
};

using SessionEngineFactory = std::function<std::shared_ptr<SessionEngine>(const EngineConfiguration&)>;

} // namespace peerlink::engine
