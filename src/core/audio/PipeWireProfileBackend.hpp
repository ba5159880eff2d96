#pragma once

#include "IProfileBackend.hpp"
#include <QByteArray>

namespace btp {

class ICommandRunner;

/// Finds bluez5 devices in `pw-dump` output and switches them with `wpctl`.
class PipeWireProfileBackend : public IProfileBackend {
public:
    PipeWireProfileBackend(ICommandRunner* runner,
                           QString dumpCommand = QStringLiteral("pw-dump"),
                           QString controlCommand = QStringLiteral("wpctl"));

    AudioBackend backend() const override { return AudioBackend::PipeWire; }
    std::optional<AudioDevice> probe(const BluetoothAddress& address) override;
    ProfileSwitchResult switchProfile(const AudioDeviceId& id,
                                      uint32_t profileIndex,
                                      const QString& profileName) override;

    /// Scan a pw-dump JSON document. Returns the first object whose
    /// api.bluez5.address matches and that has at least one available profile.
    static std::optional<AudioDevice> parseDump(const QByteArray& json,
                                                const BluetoothAddress& address);

private:
    ICommandRunner* runner_;
    QString dumpCommand_;
    QString controlCommand_;
};

} // namespace btp
