#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <peerlink/core/error.hpp>
#include <peerlink/core/event.hpp>
#include <peerlink/core/wait.hpp>
#include <peerlink/connection/data_channel_registry.hpp>
#include <peerlink/connection/options.hpp>
#include <peerlink/engine/media.hpp>
#include <peerlink/engine/session_engine.hpp>
#include <peerlink/signaling/message.hpp>
#include <peerlink/signaling/signaling_channel.hpp>

namespace peerlink::connection {

// Label of the data channel opened when the server accepts the client
inline constexpr const char* DEFAULT_DATA_CHANNEL = "dataChannel";

enum class ConnectionPhase {
    Idle,
    Registering,
    Negotiating,
    Connected,
    Closing
};

const char* toString(ConnectionPhase phase);

// Why a connection was torn down without the application asking for it
enum class DisconnectReason {
    Rejected,
    ConnectionClosed,
    SignalingTransportError,
    SignalingProtocolError,
    OfferCreationError,
    AnswerCreationError,
    RemoteOfferError,
    RemoteAnswerError,
    TransportFailed
};

const char* toString(DisconnectReason reason);
core::ErrorCode toErrorCode(DisconnectReason reason);

enum class ConnectionEventKind {
    Connect,
    Disconnect,
    AddStream,
    RemoveStream,
    Data
};

// "connect", "disconnect", "addstream", "removestream", "data"
const char* toString(ConnectionEventKind kind);
std::optional<ConnectionEventKind> parseEventKind(std::string_view name);

// Event payloads, read with Event::get<T>()
struct ConnectEvent {
    std::optional<signaling::Metadata> authz_metadata;
    bool is_exist_client = false;
};

struct DisconnectEvent {
    DisconnectReason reason = DisconnectReason::ConnectionClosed;
    std::optional<core::Error> error;
};

struct StreamEvent {
    std::shared_ptr<engine::MediaStream> stream;
    std::shared_ptr<engine::MediaTrack> track;
};

struct DataEvent {
    std::string label;
    engine::DataPayload payload;
};

// Pluggable backends of a connection
struct ConnectionBackends {
    signaling::SignalingTransportFactory transport;
    engine::SessionEngineFactory engine;
};

// Client side of one signaling session with a relay server and the
// peer-to-peer session negotiated through it. Every method and callback
// runs on the event loop thread; the loop must outlive the connection.
class Connection : public std::enable_shared_from_this<Connection> {
    // Only create() can construct; callbacks need a shared owner
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    using ConnectCompletion = std::function<void(const core::Result<void>&)>;
    using DisconnectCompletion = std::function<void()>;

    // Throws InvalidArgument when a backend factory is missing.
    static std::shared_ptr<Connection> create(core::EventLoop& loop,
                                              std::string signaling_url,
                                              std::string room_id,
                                              ConnectionOptions options,
                                              ConnectionBackends backends,
                                              bool debug = false);

    Connection(Passkey,
               core::EventLoop& loop,
               std::string signaling_url,
               std::string room_id,
               ConnectionOptions options,
               ConnectionBackends backends,
               bool debug);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Open the signaling channel and register with the server. Fails with
    // AlreadyConnected while a previous attempt is alive. The completion
    // fires once: success after the server accepted the client and the
    // offer went out, failure when the attempt is torn down before that.
    core::Result<void> connect(std::shared_ptr<engine::MediaStream> local_stream = nullptr,
                               std::optional<signaling::Metadata> authn_metadata = std::nullopt,
                               ConnectCompletion completion = nullptr);

    // Tear everything down and return to Idle. Idempotent; the completion
    // runs once the engine and the signaling channel have closed or their
    // close polls gave up.
    void disconnect(DisconnectCompletion completion = nullptr);

    core::Result<void> addDataChannel(const std::string& label, const engine::DataChannelInit& init = {});
    core::Result<void> sendData(const engine::DataPayload& payload,
                                const std::string& label = DEFAULT_DATA_CHANNEL);

    // One listener per kind; a new registration replaces the previous one.
    void on(ConnectionEventKind kind, core::EventCallback callback);
    // Unknown event names are ignored and return false.
    bool on(const std::string& name, core::EventCallback callback);

    // State
    ConnectionPhase phase() const { return phase_; }
    bool isNegotiating() const { return is_negotiating_; }
    bool hasEngine() const { return engine_ != nullptr; }
    bool hasSignalingChannel() const { return channel_ != nullptr; }

    const std::string& signalingUrl() const { return signaling_url_; }
    const std::string& roomId() const { return room_id_; }
    const std::string& clientId() const { return options_.client_id; }
    const ConnectionOptions& options() const { return options_; }
    bool debug() const { return debug_; }

    const std::optional<signaling::Metadata>& authnMetadata() const { return authn_metadata_; }
    std::optional<std::string> remoteStreamId() const;
    std::shared_ptr<engine::MediaStream> remoteStream() const { return remote_stream_; }

    const DataChannelRegistry& dataChannels() const { return registry_; }

private:
    // Inbound signaling
    void onChannelOpen();
    void onSignalingMessage(const signaling::SignalingMessage& message);
    bool holdDuringAccept(const signaling::SignalingMessage& message);
    void dispatch(const signaling::SignalingMessage& message);

    void handle(const signaling::RegisterMessage& message);
    void handle(const signaling::AcceptMessage& message);
    void handle(const signaling::RejectMessage& message);
    void handle(const signaling::PingMessage& message);
    void handle(const signaling::PongMessage& message);
    void handle(const signaling::OfferMessage& message);
    void handle(const signaling::AnswerMessage& message);
    void handle(const signaling::CandidateMessage& message);
    void handle(const signaling::CloseMessage& message);
    void handle(const signaling::UnknownMessage& message);

    // Negotiation
    core::Result<void> createEngine();
    void attachLocalMedia(engine::SessionEngine& engine);
    engine::OfferOptions offerOptions() const;
    void retireEngine();
    void sendOffer(std::function<void()> then);
    void completeAccept();

    // Engine events
    void onLocalCandidate(const std::optional<engine::IceCandidate>& candidate);
    void onIceConnectionState(engine::IceConnectionState state);
    void onRemoteTrack(const engine::TrackEvent& event);

    // True while the connection is live and engine is the current one
    bool owns(const engine::SessionEngine* engine) const;
    bool active() const;

    void protocolError(const std::string& message);
    void fail(DisconnectReason reason, core::Error error);

    // Teardown
    void startCloseWaits();
    void onCloseWaitFinished(const char* what, core::WaitOutcome outcome, bool& settled);
    void finishTeardown();
    void clearSessionState();
    void resolveConnect(const core::Result<void>& result);

    void emit(ConnectionEventKind kind, std::any data);

    template<typename... Args>
    void trace(const std::string& format, Args&&... args) const {
        if (debug_) {
            core::Logger::debug(format, std::forward<Args>(args)...);
        }
    }

    core::EventLoop& loop_;
    std::string signaling_url_;
    std::string room_id_;
    ConnectionOptions options_;
    ConnectionBackends backends_;
    bool debug_;

    ConnectionPhase phase_ = ConnectionPhase::Idle;
    std::uint64_t epoch_ = 0;

    std::shared_ptr<signaling::SignalingChannel> channel_;
    std::shared_ptr<engine::SessionEngine> engine_;
    DataChannelRegistry registry_;

    std::shared_ptr<engine::MediaStream> local_stream_;
    std::shared_ptr<engine::MediaStream> remote_stream_;
    std::optional<signaling::Metadata> authn_metadata_;
    std::vector<engine::IceServer> ice_servers_;
    std::optional<ConnectEvent> accepted_;
    bool is_negotiating_ = false;

    // Set from accept until its offer is sent. A remote offer arriving
    // meanwhile is held, with the negotiation messages after it.
    bool accept_pending_ = false;
    std::vector<signaling::SignalingMessage> held_messages_;

    ConnectCompletion connect_completion_;
    std::optional<core::Error> failure_;

    // Teardown bookkeeping
    std::shared_ptr<core::BoundedWait> engine_wait_;
    std::shared_ptr<core::BoundedWait> channel_wait_;
    bool engine_settled_ = false;
    bool channel_settled_ = false;
    bool waits_armed_ = false;
    std::vector<DisconnectCompletion> closing_waiters_;

    core::EventEmitter events_;
};

} // namespace peerlink::connection
