#pragma once

#include <memory>
#include <string>

namespace drumsync {

/**
 * A loaded background-music track.
 *
 * Two clocks are involved: currentTime() is the position inside the file,
 * deviceCurrentTime() is the audio device's own clock used for scheduled
 * starts. Implementations wrap the platform audio API.
 */
class AudioPlayer {
public:
    virtual ~AudioPlayer() = default;

    [[nodiscard]] virtual double duration() const = 0;
    [[nodiscard]] virtual double currentTime() const = 0;
    virtual void setCurrentTime(double seconds) = 0;

    [[nodiscard]] virtual double deviceCurrentTime() const = 0;
    [[nodiscard]] virtual bool isPlaying() const = 0;

    /**
     * Start playback when the device clock reaches deviceTime.
     * A later pause() or stop() cancels a start that has not happened yet.
     */
    virtual bool playAtTime(double deviceTime) = 0;

    virtual void pause() = 0;
    virtual void stop() = 0;

    virtual void setRate(double rate) = 0;
    [[nodiscard]] virtual double rate() const = 0;
    virtual void setVolume(double volume) = 0;
};

using AudioPlayerPtr = std::shared_ptr<AudioPlayer>;

/**
 * Opens audio files. load() may block on file I/O and decoding and is
 * always called off the playback thread.
 */
class AudioBackend {
public:
    virtual ~AudioBackend() = default;

    /**
     * @throws AudioLoadError if the file is missing or cannot be decoded
     */
    [[nodiscard]] virtual AudioPlayerPtr load(const std::string& path) = 0;
};

using AudioBackendPtr = std::shared_ptr<AudioBackend>;

} // namespace drumsync
