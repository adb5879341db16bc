#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <peerlink/core/error.hpp>
#include <peerlink/engine/session_engine.hpp>

namespace peerlink::connection {

// Auxiliary data channels of one connection, keyed by label
class DataChannelRegistry {
public:
    using MessageHandler = std::function<void(const std::string& label, const engine::DataPayload&)>;

    struct Entry {
        std::string label;
        std::shared_ptr<engine::DataChannel> channel;
        engine::DataChannelState state = engine::DataChannelState::Connecting;
    };

    DataChannelRegistry();

    DataChannelRegistry(const DataChannelRegistry&) = delete;
    DataChannelRegistry& operator=(const DataChannelRegistry&) = delete;

    void setMessageHandler(MessageHandler handler);
    void setTrace(bool enabled);

    // Create a local channel through the engine. Fails with EngineNotReady
    // without engine and ChannelAlreadyExists for a registered label.
    core::Result<void> open(engine::SessionEngine* engine,
                            const std::string& label,
                            const engine::DataChannelInit& init = {});

    // Fails with ChannelNotOpen unless the label's channel is open.
    core::Result<void> send(const std::string& label, const engine::DataPayload& payload);

    // Register a channel announced by the remote peer. A stale entry with
    // the same label is replaced.
    void adopt(std::shared_ptr<engine::DataChannel> channel);

    // Close every channel and forget them.
    void closeAll();
    void clear();

    bool contains(const std::string& label) const;
    std::optional<engine::DataChannelState> state(const std::string& label) const;
    std::vector<std::string> labels() const;
    std::size_t size() const;
    bool empty() const { return size() == 0; }

private:
    struct State {
        std::map<std::string, Entry> entries;
        MessageHandler on_message;
        bool trace = false;
    };

    static void install(const std::shared_ptr<State>& state,
                        const std::shared_ptr<engine::DataChannel>& channel,
                        const std::string& label);

    std::shared_ptr<State> state_;
};

} // namespace peerlink::connection
