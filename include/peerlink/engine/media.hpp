#pragma once

#include <memory>
#include <string>
#include <vector>

#include <peerlink/engine/types.hpp>

namespace peerlink::engine {

// Media track handle. Capture and rendering backends derive from it to
// release their devices in stop().
class MediaTrack {
public:
    MediaTrack(std::string id, MediaKind kind);
    virtual ~MediaTrack() = default;

    const std::string& id() const { return id_; }
    MediaKind kind() const { return kind_; }

    void enable(bool enabled) { enabled_ = enabled; }
    bool isEnabled() const { return enabled_; }

    // Idempotent; calls onStop() the first time only.
    void stop();
    bool stopped() const { return stopped_; }

protected:
    virtual void onStop() {}

private:
    std::string id_;
    MediaKind kind_;
    bool enabled_ = true;
    bool stopped_ = false;
};

class MediaStream {
public:
    explicit MediaStream(std::string id);

    const std::string& id() const { return id_; }

    void addTrack(std::shared_ptr<MediaTrack> track);
    bool removeTrack(const std::string& track_id);

    const std::vector<std::shared_ptr<MediaTrack>>& tracks() const { return tracks_; }
    std::vector<std::shared_ptr<MediaTrack>> audioTracks() const;
    std::vector<std::shared_ptr<MediaTrack>> videoTracks() const;

    // First track of the given kind, or nullptr.
    std::shared_ptr<MediaTrack> firstTrack(MediaKind kind) const;

private:
    std::string id_;
    std::vector<std::shared_ptr<MediaTrack>> tracks_;
};

} // namespace peerlink::engine
