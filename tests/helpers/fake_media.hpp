#pragma once

#include "cipherlink/interfaces/i_media_devices.hpp"
#include "helpers/manual_scheduler.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cipherlink::test_helpers {

class FakeMediaTrack final : public interfaces::IMediaTrack {
public:
    FakeMediaTrack(const call::MediaKind kind, std::string id)
        : kind_(kind), id_(std::move(id)) {}

    [[nodiscard]] call::MediaKind Kind() const override { return kind_; }
    [[nodiscard]] std::string Id() const override { return id_; }
    [[nodiscard]] bool IsEnabled() const override { return enabled_; }
    void SetEnabled(const bool enabled) override { enabled_ = enabled; }
    void Stop() override { stopped_ = true; }

    [[nodiscard]] bool IsStopped() const noexcept { return stopped_; }

private:
    call::MediaKind kind_;
    std::string id_;
    bool enabled_ = true;
    bool stopped_ = false;
};

class FakeMediaStream final : public interfaces::IMediaStream {
public:
    explicit FakeMediaStream(std::string id) : id_(std::move(id)) {}

    [[nodiscard]] std::string Id() const override { return id_; }
    [[nodiscard]] std::vector<std::shared_ptr<interfaces::IMediaTrack>> Tracks() const override { return tracks_; }
    void AddTrack(std::shared_ptr<interfaces::IMediaTrack> track) override { tracks_.push_back(std::move(track)); }

    [[nodiscard]] bool AllStopped() const {
        for (const auto& track : tracks_) {
            if (!static_cast<const FakeMediaTrack&>(*track).IsStopped()) {
                return false;
            }
        }
        return true;
    }

private:
    std::string id_;
    std::vector<std::shared_ptr<interfaces::IMediaTrack>> tracks_;
};

/// Analyser whose spectrum is a shared buffer the test writes to
class FakeAnalyser final : public interfaces::IAudioAnalyser {
public:
    explicit FakeAnalyser(std::shared_ptr<std::vector<uint8_t>> bins) : bins_(std::move(bins)) {}

    std::vector<uint8_t> ByteFrequencyData() override { return *bins_; }

private:
    std::shared_ptr<std::vector<uint8_t>> bins_;
};

inline std::shared_ptr<FakeMediaStream> MakeStream(
    const std::string& id,
    const bool audio,
    const bool video) {
    auto stream = std::make_shared<FakeMediaStream>(id);
    if (audio) {
        stream->AddTrack(std::make_shared<FakeMediaTrack>(call::MediaKind::Audio, id + "-audio"));
    }
    if (video) {
        stream->AddTrack(std::make_shared<FakeMediaTrack>(call::MediaKind::Video, id + "-video"));
    }
    return stream;
}

/**
 * Capture devices that grant or deny each request through `allow`. Results
 * are delivered through the scheduler so they arrive asynchronously, as on a
 * real device.
 */
class FakeMediaDevices final : public interfaces::IMediaDevices {
public:
    explicit FakeMediaDevices(ManualScheduler& scheduler)
        : scheduler_(scheduler) {}

    void GetUserMedia(const interfaces::MediaConstraints& constraints, StreamCallback callback) override {
        requests.push_back(constraints);
        const bool granted = allow(constraints);
        std::shared_ptr<FakeMediaStream> stream;
        if (granted) {
            stream = MakeStream("local-" + std::to_string(requests.size()), constraints.audio, constraints.video);
            streams.push_back(stream);
        }
        scheduler_.ScheduleAfter(std::chrono::milliseconds(0),
            [callback = std::move(callback), stream]() {
                if (!stream) {
                    callback(Result<std::shared_ptr<interfaces::IMediaStream>, CipherlinkFailure>::Err(
                        CipherlinkFailure::MediaAcquisition("NotAllowedError")));
                    return;
                }
                callback(Result<std::shared_ptr<interfaces::IMediaStream>, CipherlinkFailure>::Ok(stream));
            });
    }

    std::unique_ptr<interfaces::IAudioAnalyser> CreateAnalyser(
        const std::shared_ptr<interfaces::IMediaStream>& stream) override {
        ++analysers_created;
        return std::make_unique<FakeAnalyser>(LevelsOf(stream ? stream->Id() : std::string()));
    }

    /// Every analyser, present and future, reports `level` in all bins
    void SetLevel(const uint8_t level) {
        default_level_ = level;
        for (auto& [id, bins] : levels_) {
            std::fill(bins->begin(), bins->end(), level);
        }
    }

    /// Only analysers of one stream report `level`
    void SetLevel(const std::string& stream_id, const uint8_t level) {
        auto bins = LevelsOf(stream_id);
        std::fill(bins->begin(), bins->end(), level);
    }

    std::function<bool(const interfaces::MediaConstraints&)> allow =
        [](const interfaces::MediaConstraints&) { return true; };
    std::vector<interfaces::MediaConstraints> requests;
    std::vector<std::shared_ptr<FakeMediaStream>> streams;
    int analysers_created = 0;

private:
    std::shared_ptr<std::vector<uint8_t>> LevelsOf(const std::string& stream_id) {
        auto& bins = levels_[stream_id];
        if (!bins) {
            bins = std::make_shared<std::vector<uint8_t>>(128, default_level_);
        }
        return bins;
    }

    ManualScheduler& scheduler_;
    uint8_t default_level_ = 0;
    std::map<std::string, std::shared_ptr<std::vector<uint8_t>>> levels_;
};

} // namespace cipherlink::test_helpers
