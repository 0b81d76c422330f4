#pragma once
#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"
#include "cipherlink/call/rtc_types.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
namespace cipherlink::interfaces {
class IMediaTrack {
public:
    virtual ~IMediaTrack() = default;
    [[nodiscard]] virtual call::MediaKind Kind() const = 0;
    [[nodiscard]] virtual std::string Id() const = 0;
    [[nodiscard]] virtual bool IsEnabled() const = 0;
    virtual void SetEnabled(bool enabled) = 0;
    virtual void Stop() = 0;
};
class IMediaStream {
public:
    virtual ~IMediaStream() = default;
    [[nodiscard]] virtual std::string Id() const = 0;
    [[nodiscard]] virtual std::vector<std::shared_ptr<IMediaTrack>> Tracks() const = 0;
    virtual void AddTrack(std::shared_ptr<IMediaTrack> track) = 0;
};
/// Frequency-domain view of an audio stream (fftSize 256, 128 bins of 0-255)
class IAudioAnalyser {
public:
    virtual ~IAudioAnalyser() = default;
    [[nodiscard]] virtual std::vector<uint8_t> ByteFrequencyData() = 0;
};
struct MediaConstraints {
    bool audio = true;
    bool video = false;
    // 0 leaves the dimension unconstrained
    uint32_t ideal_width = 0;
    uint32_t ideal_height = 0;
    bool user_facing = false;
};
/**
 * Capture devices. GetUserMedia completes asynchronously and must deliver its
 * callback on the dispatch context; a denied or missing device completes
 * with FailureType::MediaAcquisition.
 */
class IMediaDevices {
public:
    using StreamCallback = std::function<void(Result<std::shared_ptr<IMediaStream>, CipherlinkFailure>)>;
    virtual ~IMediaDevices() = default;
    virtual void GetUserMedia(const MediaConstraints& constraints, StreamCallback callback) = 0;
    [[nodiscard]] virtual std::unique_ptr<IAudioAnalyser> CreateAnalyser(
        const std::shared_ptr<IMediaStream>& stream) = 0;
};
}
