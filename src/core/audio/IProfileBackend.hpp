#pragma once

#include "AudioProfile.hpp"
#include "core/BluetoothAddress.hpp"
#include <optional>

namespace btp {

/// One audio server that may own a Bluetooth card.
class IProfileBackend {
public:
    virtual ~IProfileBackend() = default;

    virtual AudioBackend backend() const = 0;

    /// Look up the device for address. Any failure (tool missing, non-zero
    /// exit, malformed output, no match, no usable profile) yields nullopt.
    virtual std::optional<AudioDevice> probe(const BluetoothAddress& address) = 0;

    /// Issue exactly one switch command. Only called with ids this backend produced.
    virtual ProfileSwitchResult switchProfile(const AudioDeviceId& id,
                                              uint32_t profileIndex,
                                              const QString& profileName) = 0;
};

} // namespace btp
