#include <peerlink/connection/data_channel_registry.hpp>
#include <peerlink/core/logger.hpp>

namespace peerlink::connection {

using engine::DataChannel;
using engine::DataChannelState;

DataChannelRegistry::DataChannelRegistry()
    : state_(std::make_shared<State>()) {}

void DataChannelRegistry::setMessageHandler(MessageHandler handler) {
    state_->on_message = std::move(handler);
}

void DataChannelRegistry::setTrace(bool enabled) {
    state_->trace = enabled;
}

core::Result<void> DataChannelRegistry::open(engine::SessionEngine* engine,
                                             const std::string& label,
                                             const engine::DataChannelInit& init) {
    if (!engine) {
        return {core::ErrorCode::EngineNotReady, "Session engine is not ready"};
    }
    if (contains(label)) {
        return {core::ErrorCode::ChannelAlreadyExists, "Data channel '" + label + "' already exists"};
    }

    std::shared_ptr<DataChannel> channel;
    try {
        channel = engine->createDataChannel(label, init);
    }
    catch (const std::exception& e) {
        return {core::ErrorCode::InvalidState,
                "Failed to create data channel '" + label + "': " + e.what()};
    }
    if (!channel) {
        return {core::ErrorCode::InvalidState, "Engine returned no data channel for '" + label + "'"};
    }

    state_->entries[label] = Entry{label, channel, channel->state()};
    install(state_, channel, label);

    if (state_->trace) {
        core::Logger::debug("Data channel '{}' created", label);
    }
    return {};
}

core::Result<void> DataChannelRegistry::send(const std::string& label, const engine::DataPayload& payload) {
    auto it = state_->entries.find(label);
    if (it == state_->entries.end() || it->second.state != DataChannelState::Open) {
        return {core::ErrorCode::ChannelNotOpen, "Data channel '" + label + "' is not open"};
    }

    auto channel = it->second.channel;
    try {
        channel->send(payload);
    }
    catch (const std::exception& e) {
        return {core::ErrorCode::InvalidState,
                "Failed to send on data channel '" + label + "': " + e.what()};
    }
    return {};
}

void DataChannelRegistry::adopt(std::shared_ptr<DataChannel> channel) {
    if (!channel) return;

    std::string label = channel->label();
    if (label.empty()) {
        core::Logger::debug("Ignoring remote data channel without label");
        return;
    }

    auto it = state_->entries.find(label);
    if (it != state_->entries.end() && state_->trace) {
        core::Logger::debug("Replacing data channel '{}' announced by remote peer", label);
    }

    state_->entries[label] = Entry{label, channel, channel->state()};
    install(state_, channel, label);
}

void DataChannelRegistry::closeAll() {
    auto entries = std::move(state_->entries);
    state_->entries.clear();

    for (auto& [label, entry] : entries) {
        try {
            entry.channel->close();
        }
        catch (const std::exception& e) {
            core::Logger::warn("Failed to close data channel '{}': {}", label, e.what());
        }
    }
}

void DataChannelRegistry::clear() {
    state_->entries.clear();
}

bool DataChannelRegistry::contains(const std::string& label) const {
    return state_->entries.find(label) != state_->entries.end();
}

std::optional<DataChannelState> DataChannelRegistry::state(const std::string& label) const {
    auto it = state_->entries.find(label);
    if (it == state_->entries.end()) return std::nullopt;
    return it->second.state;
}

std::vector<std::string> DataChannelRegistry::labels() const {
    std::vector<std::string> result;
    result.reserve(state_->entries.size());
    for (const auto& [label, entry] : state_->entries) {
        result.push_back(label);
    }
    return result;
}

std::size_t DataChannelRegistry::size() const {
    return state_->entries.size();
}

void DataChannelRegistry::install(const std::shared_ptr<State>& state,
                                  const std::shared_ptr<DataChannel>& channel,
                                  const std::string& label) {
    std::weak_ptr<State> weak_state = state;
    std::weak_ptr<DataChannel> weak_channel = channel;

    // Entry untuk label ini, hanya jika masih menunjuk channel yang sama
    auto current = [weak_state, weak_channel, label]() -> std::pair<std::shared_ptr<State>, Entry*> {
        auto s = weak_state.lock();
        auto ch = weak_channel.lock();
        if (!s || !ch) return {nullptr, nullptr};
        auto it = s->entries.find(label);
        if (it == s->entries.end() || it->second.channel != ch) return {s, nullptr};
        return {s, &it->second};
    };

    channel->onOpen = [current, label]() {
        auto [s, entry] = current();
        if (!entry) return;
        entry->state = DataChannelState::Open;
        if (s->trace) core::Logger::debug("datachannel onopen=> {}", label);
    };

    channel->onClose = [current, label]() {
        auto [s, entry] = current();
        if (!entry) return;
        if (s->trace) core::Logger::debug("datachannel onclose=> {}", label);
        s->entries.erase(label);
    };

    channel->onError = [current, label](const std::string& error) {
        auto [s, entry] = current();
        if (!entry) return;
        core::Logger::warn("Data channel '{}' error: {}", label, error);
        s->entries.erase(label);
    };

    channel->onMessage = [weak_state, label](const engine::DataPayload& payload) {
        auto s = weak_state.lock();
        if (!s) return;
        if (s->trace) core::Logger::debug("datachannel onmessage=> {}", label);
        auto handler = s->on_message;
        if (handler) handler(label, payload);
    };
}

} // namespace peerlink::connection
