#pragma once

#include <stdexcept>
#include <string>

namespace drumsync {

/**
 * Playback was configured with values it cannot run with
 * (non-positive bpm, empty note schedule, bad time signature).
 * Callers must not attempt playback after catching this.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what)
    {
    }
};

/**
 * An audio file could not be loaded or decoded.
 * Always recoverable: playback continues without background music.
 */
class AudioLoadError : public std::runtime_error {
public:
    explicit AudioLoadError(const std::string& what)
        : std::runtime_error(what)
    {
    }
};

} // namespace drumsync
