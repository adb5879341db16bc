#include <peerlink/connection/connection.hpp>
#include <peerlink/core/logger.hpp>

#include <utility>

namespace peerlink::connection {

using engine::Direction;
using engine::IceConnectionState;
using engine::MediaKind;
using engine::SessionEngine;
using signaling::ReadyState;

const char* toString(ConnectionPhase phase) {
    switch (phase) {
        case ConnectionPhase::Idle: return "idle";
        case ConnectionPhase::Registering: return "registering";
        case ConnectionPhase::Negotiating: return "negotiating";
        case ConnectionPhase::Connected: return "connected";
        case ConnectionPhase::Closing: return "closing";
    }
    return "unknown";
}

const char* toString(DisconnectReason reason) {
    switch (reason) {
        case DisconnectReason::Rejected: return "REJECTED";
        case DisconnectReason::ConnectionClosed: return "WS-CLOSED";
        case DisconnectReason::SignalingTransportError: return "WS-ERROR";
        case DisconnectReason::SignalingProtocolError: return "SIGNALING-ERROR";
        case DisconnectReason::OfferCreationError: return "CREATE-OFFER-ERROR";
        case DisconnectReason::AnswerCreationError: return "CREATE-ANSWER-ERROR";
        case DisconnectReason::RemoteOfferError: return "SET-OFFER-ERROR";
        case DisconnectReason::RemoteAnswerError: return "SET-ANSWER-ERROR";
        case DisconnectReason::TransportFailed: return "ICE-CONNECTION-STATE-FAILED";
    }
    return "UNKNOWN";
}

core::ErrorCode toErrorCode(DisconnectReason reason) {
    switch (reason) {
        case DisconnectReason::Rejected: return core::ErrorCode::Rejected;
        case DisconnectReason::ConnectionClosed: return core::ErrorCode::ConnectionClosed;
        case DisconnectReason::SignalingTransportError: return core::ErrorCode::SignalingTransportError;
        case DisconnectReason::SignalingProtocolError: return core::ErrorCode::ProtocolError;
        case DisconnectReason::OfferCreationError: return core::ErrorCode::OfferCreationFailed;
        case DisconnectReason::AnswerCreationError: return core::ErrorCode::AnswerCreationFailed;
        case DisconnectReason::RemoteOfferError: return core::ErrorCode::RemoteOfferFailed;
        case DisconnectReason::RemoteAnswerError: return core::ErrorCode::RemoteAnswerFailed;
        case DisconnectReason::TransportFailed: return core::ErrorCode::TransportFailed;
    }
    return core::ErrorCode::Unknown;
}

const char* toString(ConnectionEventKind kind) {
    switch (kind) {
        case ConnectionEventKind::Connect: return "connect";
        case ConnectionEventKind::Disconnect: return "disconnect";
        case ConnectionEventKind::AddStream: return "addstream";
        case ConnectionEventKind::RemoveStream: return "removestream";
        case ConnectionEventKind::Data: return "data";
    }
    return "unknown";
}

std::optional<ConnectionEventKind> parseEventKind(std::string_view name) {
    if (name == "connect") return ConnectionEventKind::Connect;
    if (name == "disconnect") return ConnectionEventKind::Disconnect;
    if (name == "addstream") return ConnectionEventKind::AddStream;
    if (name == "removestream") return ConnectionEventKind::RemoveStream;
    if (name == "data") return ConnectionEventKind::Data;
    return std::nullopt;
}

std::shared_ptr<Connection> Connection::create(core::EventLoop& loop,
                                               std::string signaling_url,
                                               std::string room_id,
                                               ConnectionOptions options,
                                               ConnectionBackends backends,
                                               bool debug) {
    if (!backends.transport) {
        core::throw_error(core::ErrorCode::InvalidArgument, "Signaling transport factory is required");
    }
    if (!backends.engine) {
        core::throw_error(core::ErrorCode::InvalidArgument, "Session engine factory is required");
    }
    return std::make_shared<Connection>(Passkey{},
                                        loop,
                                        std::move(signaling_url),
                                        std::move(room_id),
                                        std::move(options),
                                        std::move(backends),
                                        debug);
}

Connection::Connection(Passkey,
                       core::EventLoop& loop,
                       std::string signaling_url,
                       std::string room_id,
                       ConnectionOptions options,
                       ConnectionBackends backends,
                       bool debug)
    : loop_(loop)
    , signaling_url_(std::move(signaling_url))
    , room_id_(std::move(room_id))
    , options_(std::move(options))
    , backends_(std::move(backends))
    , debug_(debug) {
    registry_.setTrace(debug_);
    registry_.setMessageHandler([this](const std::string& label, const engine::DataPayload& payload) {
        emit(ConnectionEventKind::Data, DataEvent{label, payload});
    });
}

Connection::~Connection() {
    if (engine_wait_) engine_wait_->cancel();
    if (channel_wait_) channel_wait_->cancel();

    registry_.closeAll();

    if (engine_) {
        try {
            engine_->close();
        }
        catch (const std::exception& e) {
            core::Logger::warn("Failed to close session engine: {}", e.what());
        }
    }
    if (channel_) {
        channel_->close();
    }

    // Backends may still be inside one of their callbacks
    if (engine_ || channel_) {
        loop_.post([engine = std::move(engine_), channel = std::move(channel_)]() {
            if (engine) engine->detach();
        });
    }
}

core::Result<void> Connection::connect(std::shared_ptr<engine::MediaStream> local_stream,
                                       std::optional<signaling::Metadata> authn_metadata,
                                       ConnectCompletion completion) {
    if (channel_ || engine_ || phase_ != ConnectionPhase::Idle) {
        return {core::ErrorCode::AlreadyConnected, "Connection already exists"};
    }

    std::shared_ptr<signaling::SignalingTransport> transport;
    try {
        transport = backends_.transport();
    }
    catch (const std::exception& e) {
        return {core::ErrorCode::SignalingTransportError,
                std::string("Failed to create signaling transport: ") + e.what()};
    }
    if (!transport) {
        return {core::ErrorCode::SignalingTransportError, "Signaling transport factory returned no transport"};
    }

    auto channel = std::make_shared<signaling::SignalingChannel>(std::move(transport));
    std::weak_ptr<Connection> weak = weak_from_this();

    channel->setOpenCallback([weak]() {
        if (auto self = weak.lock()) self->onChannelOpen();
    });
    channel->setMessageCallback([weak](const signaling::SignalingMessage& message) {
        if (auto self = weak.lock()) self->onSignalingMessage(message);
    });
    channel->setProtocolErrorCallback([weak](const core::Error& error) {
        if (auto self = weak.lock()) self->fail(DisconnectReason::SignalingProtocolError, error);
    });
    channel->setErrorCallback([weak](const std::string& error) {
        if (auto self = weak.lock()) {
            self->fail(DisconnectReason::SignalingTransportError,
                       core::Error(core::ErrorCode::SignalingTransportError, "Signaling channel error: " + error));
        }
    });
    channel->setCloseCallback([weak]() {
        if (auto self = weak.lock()) {
            self->fail(DisconnectReason::ConnectionClosed,
                       core::Error(core::ErrorCode::ConnectionClosed, "Signaling channel closed"));
        }
    });

    ++epoch_;
    phase_ = ConnectionPhase::Registering;
    channel_ = channel;
    local_stream_ = std::move(local_stream);
    authn_metadata_ = std::move(authn_metadata);
    ice_servers_ = options_.ice_servers;
    accepted_.reset();
    failure_.reset();
    connect_completion_ = std::move(completion);

    try {
        channel->open(signaling_url_);
    }
    catch (const std::exception& e) {
        // Nothing was announced yet; undo the attempt silently
        channel->close();
        channel_.reset();
        clearSessionState();
        connect_completion_ = nullptr;
        phase_ = ConnectionPhase::Idle;
        return {core::ErrorCode::SignalingTransportError,
                std::string("Failed to open signaling channel: ") + e.what()};
    }

    trace("connect: room={} client={}", room_id_, options_.client_id);
    return {};
}

void Connection::onChannelOpen() {
    if (phase_ != ConnectionPhase::Registering || !channel_) return;

    signaling::RegisterMessage message;
    message.room_id = room_id_;
    message.client_id = options_.client_id;
    message.authn_metadata = authn_metadata_;
    message.key = options_.signaling_key;

    auto sent = channel_->send(message);
    if (!sent) {
        fail(DisconnectReason::SignalingTransportError, sent.error());
        return;
    }
    trace("send register: room={}", room_id_);
}

void Connection::onSignalingMessage(const signaling::SignalingMessage& message) {
    if (!active()) return;
    trace("recv {}", signaling::messageType(message));
    if (holdDuringAccept(message)) return;
    dispatch(message);
}

bool Connection::holdDuringAccept(const signaling::SignalingMessage& message) {
    if (!accept_pending_) return false;

    bool hold = std::holds_alternative<signaling::OfferMessage>(message);
    if (!held_messages_.empty()) {
        hold = hold
            || std::holds_alternative<signaling::AnswerMessage>(message)
            || std::holds_alternative<signaling::CandidateMessage>(message);
    }
    if (!hold) return false;

    trace("hold {} until the offer is sent", signaling::messageType(message));
    held_messages_.push_back(message);
    return true;
}

void Connection::dispatch(const signaling::SignalingMessage& message) {
    std::visit([this](const auto& m) { handle(m); }, message);
}

void Connection::handle(const signaling::RegisterMessage&) {
    protocolError("Unexpected register message from server");
}

void Connection::handle(const signaling::AcceptMessage& message) {
    if (phase_ != ConnectionPhase::Registering) {
        protocolError(std::string("Unexpected accept in phase ") + toString(phase_));
        return;
    }

    phase_ = ConnectionPhase::Negotiating;
    accepted_ = ConnectEvent{message.authz_metadata, message.is_exist_client};
    if (!message.ice_servers.empty()) {
        ice_servers_ = message.ice_servers;
    }

    auto created = createEngine();
    if (!created) {
        fail(DisconnectReason::OfferCreationError, created.error());
        return;
    }

    auto opened = registry_.open(engine_.get(), DEFAULT_DATA_CHANNEL);
    if (!opened) {
        core::Logger::warn("Failed to open default data channel: {}", opened.error().what());
    }

    accept_pending_ = true;
    std::weak_ptr<Connection> weak = weak_from_this();
    sendOffer([weak]() {
        if (auto self = weak.lock()) self->completeAccept();
    });
}

void Connection::handle(const signaling::RejectMessage& message) {
    std::string reason = message.reason.value_or("registration rejected");
    fail(DisconnectReason::Rejected, core::Error(core::ErrorCode::Rejected, "Rejected by server: " + reason));
}

void Connection::handle(const signaling::PingMessage&) {
    auto sent = channel_->send(signaling::PongMessage{});
    if (!sent) {
        core::Logger::warn("Failed to answer ping: {}", sent.error().what());
    }
}

void Connection::handle(const signaling::PongMessage&) {}

void Connection::handle(const signaling::OfferMessage& message) {
    if (phase_ != ConnectionPhase::Negotiating && phase_ != ConnectionPhase::Connected) {
        protocolError(std::string("Unexpected offer in phase ") + toString(phase_));
        return;
    }

    retireEngine();
    auto created = createEngine();
    if (!created) {
        fail(DisconnectReason::RemoteOfferError, created.error());
        return;
    }

    phase_ = ConnectionPhase::Negotiating;
    is_negotiating_ = true;

    std::weak_ptr<Connection> weak = weak_from_this();
    SessionEngine* raw = engine_.get();
    engine::SessionDescription offer{engine::SdpType::Offer, message.sdp};

    engine_->setRemoteDescription(offer, [weak, raw](core::Result<void> applied) {
        auto self = weak.lock();
        if (!self || !self->owns(raw)) return;
        if (!applied) {
            self->fail(DisconnectReason::RemoteOfferError, applied.error());
            return;
        }

        self->engine_->createAnswer([weak, raw](core::Result<engine::SessionDescription> answer) {
            auto self = weak.lock();
            if (!self || !self->owns(raw)) return;
            if (!answer) {
                self->fail(DisconnectReason::AnswerCreationError, answer.error());
                return;
            }

            auto description = answer.value();
            self->engine_->setLocalDescription(description, [weak, raw, description](core::Result<void> applied) {
                auto self = weak.lock();
                if (!self || !self->owns(raw)) return;
                if (!applied) {
                    self->fail(DisconnectReason::AnswerCreationError, applied.error());
                    return;
                }

                auto local = self->engine_->localDescription().value_or(description);
                auto sent = self->channel_->send(signaling::AnswerMessage{local.sdp});
                if (!sent) {
                    self->fail(DisconnectReason::SignalingTransportError, sent.error());
                    return;
                }
                self->trace("send answer");
            });
        });
    });
}

void Connection::handle(const signaling::AnswerMessage& message) {
    if (!engine_) {
        protocolError("Unexpected answer without session engine");
        return;
    }

    std::weak_ptr<Connection> weak = weak_from_this();
    SessionEngine* raw = engine_.get();
    engine::SessionDescription answer{engine::SdpType::Answer, message.sdp};

    engine_->setRemoteDescription(answer, [weak, raw](core::Result<void> applied) {
        auto self = weak.lock();
        if (!self || !self->owns(raw)) return;
        if (!applied) {
            self->fail(DisconnectReason::RemoteAnswerError, applied.error());
            return;
        }
        self->trace("remote answer applied");
    });
}

void Connection::handle(const signaling::CandidateMessage& message) {
    if (!message.ice) {
        trace("candidate message without ice");
        return;
    }
    if (!engine_) {
        trace("candidate before session engine, ignored");
        return;
    }

    trace("Received ICE candidate ... {}", message.ice->candidate);
    std::weak_ptr<Connection> weak = weak_from_this();
    engine_->addIceCandidate(*message.ice, [weak](core::Result<void> added) {
        if (!added && !weak.expired()) {
            core::Logger::debug("invalid ice candidate: {}", added.error().what());
        }
    });
}

void Connection::handle(const signaling::CloseMessage&) {
    fail(DisconnectReason::ConnectionClosed,
         core::Error(core::ErrorCode::ConnectionClosed, "Session closed by server"));
}

void Connection::handle(const signaling::UnknownMessage& message) {
    core::Logger::debug("Ignoring signaling message of unknown type '{}'", message.type);
}

core::Result<void> Connection::createEngine() {
    engine::EngineConfiguration config{ice_servers_};

    std::shared_ptr<SessionEngine> engine;
    try {
        engine = backends_.engine(config);
        if (engine) attachLocalMedia(*engine);
    }
    catch (const std::exception& e) {
        return {core::ErrorCode::EngineNotReady, std::string("Failed to create session engine: ") + e.what()};
    }
    if (!engine) {
        return {core::ErrorCode::EngineNotReady, "Session engine factory returned no engine"};
    }

    std::weak_ptr<Connection> weak = weak_from_this();
    SessionEngine* raw = engine.get();

    engine->onIceCandidate = [weak, raw](const std::optional<engine::IceCandidate>& candidate) {
        auto self = weak.lock();
        if (self && self->owns(raw)) self->onLocalCandidate(candidate);
    };
    engine->onIceConnectionStateChange = [weak, raw](IceConnectionState state) {
        auto self = weak.lock();
        if (self && self->owns(raw)) self->onIceConnectionState(state);
    };
    engine->onTrack = [weak, raw](const engine::TrackEvent& event) {
        auto self = weak.lock();
        if (self && self->owns(raw)) self->onRemoteTrack(event);
    };
    engine->onDataChannel = [weak, raw](std::shared_ptr<engine::DataChannel> channel) {
        auto self = weak.lock();
        if (!self || !self->owns(raw)) return;
        self->trace("on data channel: {}", channel ? channel->label() : std::string());
        self->registry_.adopt(std::move(channel));
    };
    engine->onSignalingStateChange = [weak, raw](engine::SignalingState state) {
        auto self = weak.lock();
        if (self && self->owns(raw)) self->trace("signaling state changes: {}", engine::toString(state));
    };

    engine_ = std::move(engine);
    trace("session engine created with {} ice server(s)", ice_servers_.size());
    return {};
}

void Connection::attachLocalMedia(SessionEngine& engine) {
    auto attach = [&](MediaKind kind, Direction direction, bool enabled, std::optional<engine::VideoCodec> codec) {
        auto track = local_stream_ ? local_stream_->firstTrack(kind) : nullptr;
        engine::TransceiverInit init{direction, codec};

        if (track && direction != Direction::RecvOnly) {
            engine.addTrack(track, local_stream_->id(), init);
        }
        else if (enabled) {
            init.direction = Direction::RecvOnly;
            engine.addTransceiver(kind, init);
        }
    };

    attach(MediaKind::Audio, options_.audio.direction, options_.audio.enabled, std::nullopt);
    attach(MediaKind::Video, options_.video.direction, options_.video.enabled, options_.video.codec);
}

engine::OfferOptions Connection::offerOptions() const {
    engine::OfferOptions offer;
    offer.offer_to_receive_audio = options_.audio.enabled && options_.audio.direction != Direction::SendOnly;
    offer.offer_to_receive_video = options_.video.enabled && options_.video.direction != Direction::SendOnly;
    return offer;
}

void Connection::retireEngine() {
    if (!engine_) return;

    trace("retiring session engine for new remote offer");
    registry_.closeAll();
    is_negotiating_ = false;

    auto old = std::move(engine_);
    try {
        old->close();
    }
    catch (const std::exception& e) {
        core::Logger::warn("Failed to close retired session engine: {}", e.what());
    }
    loop_.post([old]() { old->detach(); });
}

void Connection::sendOffer(std::function<void()> then) {
    if (is_negotiating_) {
        trace("offer skipped, negotiation in progress");
        if (then) then();
        return;
    }
    is_negotiating_ = true;

    std::weak_ptr<Connection> weak = weak_from_this();
    std::uint64_t epoch = epoch_;
    SessionEngine* raw = engine_.get();

    // Sesudah teardown: buang. Engine diganti offer dari remote: lanjut tanpa kirim.
    auto current = [weak, epoch, raw](const std::function<void()>& then) -> std::shared_ptr<Connection> {
        auto self = weak.lock();
        if (!self || !self->active() || self->epoch_ != epoch) return nullptr;
        if (self->engine_.get() != raw) {
            self->trace("offer dropped, session engine was replaced");
            if (then) then();
            return nullptr;
        }
        return self;
    };

    engine_->createOffer(offerOptions(), [current, then](core::Result<engine::SessionDescription> offer) {
        auto self = current(then);
        if (!self) return;
        if (!offer) {
            self->fail(DisconnectReason::OfferCreationError, offer.error());
            return;
        }

        auto description = offer.value();
        self->engine_->setLocalDescription(description, [current, then, description](core::Result<void> applied) {
            auto self = current(then);
            if (!self) return;
            if (!applied) {
                self->fail(DisconnectReason::OfferCreationError, applied.error());
                return;
            }

            auto local = self->engine_->localDescription().value_or(description);
            auto sent = self->channel_->send(signaling::OfferMessage{local.sdp});
            if (!sent) {
                self->fail(DisconnectReason::SignalingTransportError, sent.error());
                return;
            }
            self->trace("send offer");
            if (then) then();
        });
    });
}

void Connection::completeAccept() {
    if (!active()) return;
    accept_pending_ = false;

    ConnectEvent event = accepted_.value_or(ConnectEvent{});
    trace("connected to room {}", room_id_);
    emit(ConnectionEventKind::Connect, event);
    resolveConnect({});

    // Replay in arrival order; a listener or a message may end the session
    auto held = std::move(held_messages_);
    held_messages_.clear();
    for (const auto& message : held) {
        if (!active()) return;
        dispatch(message);
    }
}

void Connection::onLocalCandidate(const std::optional<engine::IceCandidate>& candidate) {
    if (!candidate) {
        trace("empty ice event");
        return;
    }

    trace("send candidate: {}", candidate->candidate);
    auto sent = channel_->send(signaling::CandidateMessage{candidate});
    if (!sent) {
        core::Logger::warn("Failed to send ICE candidate: {}", sent.error().what());
    }
}

void Connection::onIceConnectionState(IceConnectionState state) {
    trace("ICE connection Status has changed to {}", engine::toString(state));

    switch (state) {
        case IceConnectionState::Connected:
        case IceConnectionState::Completed:
            is_negotiating_ = false;
            if (phase_ == ConnectionPhase::Negotiating) {
                phase_ = ConnectionPhase::Connected;
            }
            break;
        case IceConnectionState::Failed:
            fail(DisconnectReason::TransportFailed,
                 core::Error(core::ErrorCode::TransportFailed, "ICE connection failed"));
            break;
        default:
            break;
    }
}

void Connection::onRemoteTrack(const engine::TrackEvent& event) {
    if (!event.track) return;

    if (!remote_stream_) {
        std::string id = event.stream_ids.empty() ? generateClientId() : event.stream_ids.front();
        remote_stream_ = std::make_shared<engine::MediaStream>(id);
    }
    remote_stream_->addTrack(event.track);

    trace("peer.ontrack() {} track {}", engine::toString(event.track->kind()), event.track->id());
    emit(ConnectionEventKind::AddStream, StreamEvent{remote_stream_, event.track});
}

bool Connection::owns(const SessionEngine* engine) const {
    return engine && engine_.get() == engine && active();
}

bool Connection::active() const {
    return phase_ != ConnectionPhase::Idle && phase_ != ConnectionPhase::Closing;
}

void Connection::protocolError(const std::string& message) {
    fail(DisconnectReason::SignalingProtocolError, core::Error(core::ErrorCode::ProtocolError, message));
}

void Connection::fail(DisconnectReason reason, core::Error error) {
    if (!active()) return;

    core::Logger::warn("Connection to room {} failed ({}): {}", room_id_, toString(reason), error.what());
    failure_ = error;

    std::weak_ptr<Connection> weak = weak_from_this();
    DisconnectEvent event{reason, std::move(error)};
    disconnect([weak, event]() {
        if (auto self = weak.lock()) {
            self->emit(ConnectionEventKind::Disconnect, event);
        }
    });
}

core::Result<void> Connection::addDataChannel(const std::string& label, const engine::DataChannelInit& init) {
    if (!active()) {
        return {core::ErrorCode::EngineNotReady, "Connection is not established"};
    }
    return registry_.open(engine_.get(), label, init);
}

core::Result<void> Connection::sendData(const engine::DataPayload& payload, const std::string& label) {
    return registry_.send(label, payload);
}

void Connection::on(ConnectionEventKind kind, core::EventCallback callback) {
    events_.on(toString(kind), std::move(callback));
}

bool Connection::on(const std::string& name, core::EventCallback callback) {
    auto kind = parseEventKind(name);
    if (!kind) {
        trace("ignoring listener for unknown event '{}'", name);
        return false;
    }
    on(*kind, std::move(callback));
    return true;
}

std::optional<std::string> Connection::remoteStreamId() const {
    if (!remote_stream_) return std::nullopt;
    return remote_stream_->id();
}

void Connection::disconnect(DisconnectCompletion completion) {
    if (phase_ == ConnectionPhase::Closing) {
        if (completion) closing_waiters_.push_back(std::move(completion));
        return;
    }
    if (phase_ == ConnectionPhase::Idle && !channel_ && !engine_) {
        if (completion) completion();
        return;
    }

    if (completion) closing_waiters_.push_back(std::move(completion));
    phase_ = ConnectionPhase::Closing;
    ++epoch_;
    trace("disconnect from room {}", room_id_);

    registry_.closeAll();
    startCloseWaits();

    // Local media
    if (local_stream_) {
        for (const auto& track : local_stream_->tracks()) {
            try {
                track->stop();
            }
            catch (const std::exception& e) {
                core::Logger::warn("Failed to stop local track {}: {}", track->id(), e.what());
            }
        }
    }

    // Remote media
    if (remote_stream_) {
        auto stream = std::move(remote_stream_);
        remote_stream_.reset();
        emit(ConnectionEventKind::RemoveStream, StreamEvent{stream, nullptr});
    }

    clearSessionState();

    waits_armed_ = true;
    finishTeardown();
}

void Connection::startCloseWaits() {
    std::weak_ptr<Connection> weak = weak_from_this();
    core::WaitPolicy policy{options_.close_poll_interval, options_.close_poll_attempts};

    waits_armed_ = false;
    engine_settled_ = !engine_;
    channel_settled_ = !channel_;

    if (engine_) {
        SessionEngine* raw = engine_.get();
        try {
            engine_->close();
        }
        catch (const std::exception& e) {
            core::Logger::warn("Failed to close session engine: {}", e.what());
        }

        engine_wait_ = core::BoundedWait::start(loop_, policy,
            [weak, raw]() {
                auto self = weak.lock();
                if (!self || self->engine_.get() != raw) return core::WaitStatus::Lost;
                return raw->signalingState() == engine::SignalingState::Closed
                    ? core::WaitStatus::Done
                    : core::WaitStatus::Pending;
            },
            [weak](core::WaitOutcome outcome) {
                if (auto self = weak.lock()) {
                    self->onCloseWaitFinished("session engine", outcome, self->engine_settled_);
                }
            });
    }

    if (channel_) {
        signaling::SignalingChannel* raw = channel_.get();
        channel_->close();

        channel_wait_ = core::BoundedWait::start(loop_, policy,
            [weak, raw]() {
                auto self = weak.lock();
                if (!self || self->channel_.get() != raw) return core::WaitStatus::Lost;
                return raw->readyState() == ReadyState::Closed
                    ? core::WaitStatus::Done
                    : core::WaitStatus::Pending;
            },
            [weak](core::WaitOutcome outcome) {
                if (auto self = weak.lock()) {
                    self->onCloseWaitFinished("signaling channel", outcome, self->channel_settled_);
                }
            });
    }
}

void Connection::onCloseWaitFinished(const char* what, core::WaitOutcome outcome, bool& settled) {
    switch (outcome) {
        case core::WaitOutcome::Completed:
            trace("{} closed", what);
            break;
        case core::WaitOutcome::TimedOut:
            core::Logger::warn("{} close timeout", what);
            break;
        case core::WaitOutcome::Lost:
            core::Logger::warn("{} closing error", what);
            break;
        case core::WaitOutcome::Cancelled:
            return;
    }

    settled = true;
    finishTeardown();
}

void Connection::finishTeardown() {
    if (!waits_armed_ || !engine_settled_ || !channel_settled_ || phase_ != ConnectionPhase::Closing) {
        return;
    }
    waits_armed_ = false;
    engine_wait_.reset();
    channel_wait_.reset();

    // Release on a later turn; this may run inside a backend callback
    if (engine_ || channel_) {
        loop_.post([engine = std::move(engine_), channel = std::move(channel_)]() {
            if (engine) engine->detach();
        });
        engine_.reset();
        channel_.reset();
    }
    registry_.clear();
    phase_ = ConnectionPhase::Idle;
    trace("disconnected from room {}", room_id_);

    // A waiter may start a new attempt; take this attempt's state first
    auto waiters = std::move(closing_waiters_);
    closing_waiters_.clear();
    auto failure = std::move(failure_);
    failure_.reset();
    auto completion = std::move(connect_completion_);
    connect_completion_ = nullptr;

    for (auto& waiter : waiters) {
        try {
            waiter();
        }
        catch (const std::exception& e) {
            core::Logger::error("Disconnect completion threw: {}", e.what());
        }
    }

    if (!completion) return;
    core::Result<void> result = failure
        ? core::Result<void>(*failure)
        : core::Result<void>(core::ErrorCode::ConnectionClosed, "Connection closed before it was established");
    try {
        completion(result);
    }
    catch (const std::exception& e) {
        core::Logger::error("Connect completion threw: {}", e.what());
    }
}

void Connection::clearSessionState() {
    authn_metadata_.reset();
    accepted_.reset();
    is_negotiating_ = false;
    accept_pending_ = false;
    held_messages_.clear();
    local_stream_.reset();
    remote_stream_.reset();
}

void Connection::resolveConnect(const core::Result<void>& result) {
    auto completion = std::move(connect_completion_);
    connect_completion_ = nullptr;
    if (!completion) return;

    try {
        completion(result);
    }
    catch (const std::exception& e) {
        core::Logger::error("Connect completion threw: {}", e.what());
    }
}

void Connection::emit(ConnectionEventKind kind, std::any data) {
    events_.emit(toString(kind), std::move(data));
}

} // namespace peerlink::connection
