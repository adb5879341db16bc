#include <peerlink/engine/media.hpp>

#include <algorithm>
#include <iterator>

namespace peerlink::engine {

MediaTrack::MediaTrack(std::string id, MediaKind kind)
    : id_(std::move(id)), kind_(kind) {}

void MediaTrack::stop() {
    if (stopped_) return;
    stopped_ = true;
    enabled_ = false;
    onStop();
}

MediaStream::MediaStream(std::string id) : id_(std::move(id)) {}

void MediaStream::addTrack(std::shared_ptr<MediaTrack> track) {
    if (!track) return;
    auto it = std::find_if(tracks_.begin(), tracks_.end(),
        [&](const auto& existing) { return existing->id() == track->id(); });
    if (it == tracks_.end()) {
        tracks_.push_back(std::move(track));
    }
}

bool MediaStream::removeTrack(const std::string& track_id) {
    auto it = std::remove_if(tracks_.begin(), tracks_.end(),
        [&](const auto& track) { return track->id() == track_id; });
    if (it == tracks_.end()) return false;
    tracks_.erase(it, tracks_.end());
    return true;
}

std::vector<std::shared_ptr<MediaTrack>> MediaStream::audioTracks() const {
    std::vector<std::shared_ptr<MediaTrack>> result;
    std::copy_if(tracks_.begin(), tracks_.end(), std::back_inserter(result),
        [](const auto& track) { return track->kind() == MediaKind::Audio; });
    return result;
}

std::vector<std::shared_ptr<MediaTrack>> MediaStream::videoTracks() const {
    std::vector<std::shared_ptr<MediaTrack>> result;
    std::copy_if(tracks_.begin(), tracks_.end(), std::back_inserter(result),
        [](const auto& track) { return track->kind() == MediaKind::Video; });
    return result;
}

std::shared_ptr<MediaTrack> MediaStream::firstTrack(MediaKind kind) const {
    auto it = std::find_if(tracks_.begin(), tracks_.end(),
        [kind](const auto& track) { return track->kind() == kind; });
    return it != tracks_.end() ? *it : nullptr;
}

} // namespace peerlink::engine
