#include "AudioProfileService.hpp"
#include "PipeWireProfileBackend.hpp"
#include "PulseAudioProfileBackend.hpp"
#include "core/YamlConfig.hpp"
#include <boost/log/trivial.hpp>
#include <utility>

namespace btp {

void AudioProfileService::addBackend(std::unique_ptr<IProfileBackend> backend)
{
    if (backend)
        backends_.push_back(std::move(backend));
}

std::unique_ptr<AudioProfileService> AudioProfileService::fromConfig(const YamlConfig& config,
                                                                     ICommandRunner* runner)
{
    auto service = std::make_unique<AudioProfileService>();

    for (const auto& name : config.backendOrder()) {
        const auto backend = backendFromName(name);
        if (!backend) {
            BOOST_LOG_TRIVIAL(warning) << "[AudioProfileService] unknown backend '"
                                       << name.toStdString() << "' in backends.order";
            continue;
        }
        if (service->backendFor(*backend)) {
            BOOST_LOG_TRIVIAL(warning) << "[AudioProfileService] backend '"
                                       << name.toStdString() << "' listed twice";
            continue;
        }

        switch (*backend) {
        case AudioBackend::PipeWire:
            service->addBackend(std::make_unique<PipeWireProfileBackend>(
                runner, config.pipeWireDumpCommand(), config.pipeWireControlCommand()));
            break;
        case AudioBackend::PulseAudio:
            service->addBackend(std::make_unique<PulseAudioProfileBackend>(
                runner, config.pulseAudioControlCommand()));
            break;
        }
    }

    return service;
}

QList<AudioBackend> AudioProfileService::backends() const
{
    QList<AudioBackend> out;
    for (const auto& b : backends_)
        out.append(b->backend());
    return out;
}

std::optional<AudioDevice> AudioProfileService::discover(const BluetoothAddress& address)
{
    if (!address.isValid()) {
        BOOST_LOG_TRIVIAL(error) << "[AudioProfileService] discover called with invalid address";
        return std::nullopt;
    }

    for (const auto& backend : backends_) {
        if (auto device = backend->probe(address))
            return device;
        BOOST_LOG_TRIVIAL(debug) << "[AudioProfileService] "
                                 << backendName(backend->backend()).toStdString()
                                 << " has no device for " << address.toString().toStdString();
    }

    BOOST_LOG_TRIVIAL(info) << "[AudioProfileService] no controllable audio profile for "
                            << address.toString().toStdString();
    return std::nullopt;
}

ProfileSwitchResult AudioProfileService::switchProfile(const AudioDevice& device,
                                                       uint32_t profileIndex,
                                                       const QString& profileName)
{
    IProfileBackend* backend = backendFor(device.id.backend);
    if (!backend) {
        return ProfileSwitchResult::failure(
            QStringLiteral("No backend available for %1").arg(backendName(device.id.backend)));
    }
    return backend->switchProfile(device.id, profileIndex, profileName);
}

ProfileSwitchResult AudioProfileService::switchProfile(const AudioDevice& device,
                                                       const AudioProfile& profile)
{
    return switchProfile(device, profile.index, profile.name);
}

IProfileBackend* AudioProfileService::backendFor(AudioBackend backend) const
{
    for (const auto& b : backends_) {
        if (b->backend() == backend)
            return b.get();
    }
    return nullptr;
}

} // namespace btp
