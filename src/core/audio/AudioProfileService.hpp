#pragma once

#include "IProfileBackend.hpp"
#include <memory>
#include <vector>

namespace btp {

class ICommandRunner;
class YamlConfig;

/// Ordered set of backends. Discovery asks each one in turn and the first
/// device found wins; switching goes to the backend that produced the device.
class AudioProfileService {
public:
    AudioProfileService() = default;

    /// Backends are probed in the order they were added.
    void addBackend(std::unique_ptr<IProfileBackend> backend);

    /// Builds the backends named by backends.order, using the configured
    /// tool commands. Unknown names are logged and skipped.
    static std::unique_ptr<AudioProfileService> fromConfig(const YamlConfig& config,
                                                           ICommandRunner* runner);

    QList<AudioBackend> backends() const;

    std::optional<AudioDevice> discover(const BluetoothAddress& address);

    ProfileSwitchResult switchProfile(const AudioDevice& device,
                                      uint32_t profileIndex,
                                      const QString& profileName);
    ProfileSwitchResult switchProfile(const AudioDevice& device, const AudioProfile& profile);

private:
    IProfileBackend* backendFor(AudioBackend backend) const;

    std::vector<std::unique_ptr<IProfileBackend>> backends_;
};

} // namespace btp
