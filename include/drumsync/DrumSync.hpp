#pragma once

/**
 * drumsync - Timing & Input-Matching Core for drum practice
 *
 * Beat clock, metronome, background-track sync, note schedule and
 * hit matching for rhythm-game style playback.
 */

// Core utilities
#include "Types.hpp"
#include "Util.hpp"
#include "Log.hpp"
#include "Errors.hpp"
#include "TimeSource.hpp"

// Patterns
#include "SafetyCurtain.hpp"
#include "OneShot.hpp"
#include "ApiSchema.hpp"

// Timing
#include "BeatSnapshot.hpp"
#include "BeatClock.hpp"
#include "BeatListener.hpp"
#include "Metronome.hpp"

// Notes and input
#include "NoteSchedule.hpp"
#include "NoteMatch.hpp"
#include "InputListener.hpp"
#include "InputMatcher.hpp"
#include "InputMapper.hpp"
#include "ScoreTally.hpp"

// Audio and playback
#include "AudioPlayer.hpp"
#include "AudioTransportSync.hpp"
#include "PlaybackState.hpp"
#include "PracticeSettings.hpp"
#include "PlaybackCoordinator.hpp"

// Data
#include "data/SQLiteConnection.hpp"
#include "data/SettingsStore.hpp"
#include "data/DtxParser.hpp"
