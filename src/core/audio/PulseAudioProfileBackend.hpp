#pragma once

#include "IProfileBackend.hpp"
#include <QByteArray>

namespace btp {

class ICommandRunner;

/// Finds bluez cards in `pactl --format=json list cards` and switches them
/// with `pactl set-card-profile`. Works against pipewire-pulse as well.
class PulseAudioProfileBackend : public IProfileBackend {
public:
    explicit PulseAudioProfileBackend(ICommandRunner* runner,
                                      QString controlCommand = QStringLiteral("pactl"));

    AudioBackend backend() const override { return AudioBackend::PulseAudio; }
    std::optional<AudioDevice> probe(const BluetoothAddress& address) override;
    ProfileSwitchResult switchProfile(const AudioDeviceId& id,
                                      uint32_t profileIndex,
                                      const QString& profileName) override;

    /// A card matches when its api.bluez5.address (or device.string) property
    /// equals the address, or when its name embeds the address.
    /// Profile indices are positions among the kept (available, non-"off") profiles.
    static std::optional<AudioDevice> parseCards(const QByteArray& json,
                                                 const BluetoothAddress& address);

private:
    ICommandRunner* runner_;
    QString controlCommand_;
};

} // namespace btp
