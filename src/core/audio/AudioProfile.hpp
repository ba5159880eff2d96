#pragma once

#include "core/process/ICommandRunner.hpp"
#include <QList>
#include <QString>
#include <cstdint>
#include <optional>

namespace btp {

enum class AudioBackend {
    PipeWire,
    PulseAudio
};

QString backendName(AudioBackend backend);

/// Parses "pipewire" / "pulseaudio" (case-insensitive).
std::optional<AudioBackend> backendFromName(const QString& name);

struct AudioProfile {
    uint32_t index = 0;     // backend-local ordinal
    QString name;           // e.g. "a2dp-sink", "headset-head-unit"
    QString description;    // display name
    bool available = false;
};

/// Backend-specific handle of a card/device.
struct AudioDeviceId {
    AudioBackend backend = AudioBackend::PipeWire;
    uint32_t objectId = 0;  // PipeWire object id (wpctl set-profile <id> <index>)
    QString cardName;       // PulseAudio card name (pactl set-card-profile <name> <profile>)

    static AudioDeviceId pipeWire(uint32_t id);
    static AudioDeviceId pulseAudio(const QString& name);

    QString toString() const;

    bool operator==(const AudioDeviceId& other) const;
};

struct AudioDevice {
    AudioDeviceId id;
    QList<AudioProfile> profiles;               // available, non-"off" only
    std::optional<uint32_t> activeProfileIndex;

    const AudioProfile* profileByName(const QString& name) const;
    const AudioProfile* profileByIndex(uint32_t index) const;

    /// Exact name first, then a decimal index. A profile literally named "2"
    /// wins over the profile whose index is 2.
    const AudioProfile* resolveProfile(const QString& nameOrIndex) const;

    /// nullptr when no active index was reported or it names no listed profile.
    const AudioProfile* activeProfile() const;
};

struct ProfileSwitchResult {
    bool ok = false;
    QString message;

    static ProfileSwitchResult success(const QString& message);
    static ProfileSwitchResult failure(const QString& message);

    /// Maps a finished switch command to a result: exit status zero is the
    /// only success, anything else embeds stderr or the launch failure.
    static ProfileSwitchResult fromCommand(const QString& program, const CommandResult& result);
};

} // namespace btp
