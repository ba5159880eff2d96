#include "AudioProfile.hpp"
#include <QFileInfo>

namespace btp {

QString backendName(AudioBackend backend)
{
    switch (backend) {
    case AudioBackend::PipeWire:
        return QStringLiteral("pipewire");
    case AudioBackend::PulseAudio:
        return QStringLiteral("pulseaudio");
    }
    return {};
}

std::optional<AudioBackend> backendFromName(const QString& name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("pipewire"))
        return AudioBackend::PipeWire;
    if (key == QLatin1String("pulseaudio"))
        return AudioBackend::PulseAudio;
    return std::nullopt;
}

AudioDeviceId AudioDeviceId::pipeWire(uint32_t id)
{
    AudioDeviceId d;
    d.backend = AudioBackend::PipeWire;
    d.objectId = id;
    return d;
}

AudioDeviceId AudioDeviceId::pulseAudio(const QString& name)
{
    AudioDeviceId d;
    d.backend = AudioBackend::PulseAudio;
    d.cardName = name;
    return d;
}

QString AudioDeviceId::toString() const
{
    if (backend == AudioBackend::PipeWire)
        return QString::number(objectId);
    return cardName;
}

bool AudioDeviceId::operator==(const AudioDeviceId& other) const
{
    if (backend != other.backend)
        return false;
    return backend == AudioBackend::PipeWire ? objectId == other.objectId
                                             : cardName == other.cardName;
}

const AudioProfile* AudioDevice::profileByName(const QString& name) const
{
    for (const auto& p : profiles) {
        if (p.name == name)
            return &p;
    }
    return nullptr;
}

const AudioProfile* AudioDevice::profileByIndex(uint32_t index) const
{
    for (const auto& p : profiles) {
        if (p.index == index)
            return &p;
    }
    return nullptr;
}

const AudioProfile* AudioDevice::resolveProfile(const QString& nameOrIndex) const
{
    if (const auto* byName = profileByName(nameOrIndex))
        return byName;

    bool ok = false;
    const uint index = nameOrIndex.toUInt(&ok);
    return ok ? profileByIndex(index) : nullptr;
}

const AudioProfile* AudioDevice::activeProfile() const
{
    if (!activeProfileIndex)
        return nullptr;
    // PulseAudio reports the active index as a position in the filtered list,
    // which coincides with AudioProfile::index for that backend.
    return profileByIndex(*activeProfileIndex);
}

ProfileSwitchResult ProfileSwitchResult::success(const QString& message)
{
    return {true, message};
}

ProfileSwitchResult ProfileSwitchResult::failure(const QString& message)
{
    return {false, message};
}

ProfileSwitchResult ProfileSwitchResult::fromCommand(const QString& program,
                                                     const CommandResult& result)
{
    const QString tool = QFileInfo(program).fileName();

    if (result.succeeded())
        return success(QStringLiteral("Profile switched"));
    if (!result.started)
        return failure(QStringLiteral("Failed to run %1: %2").arg(tool, result.errorString));
    if (result.timedOut)
        return failure(QStringLiteral("%1 %2").arg(tool, result.errorString));

    QString stderrText = QString::fromUtf8(result.standardError).trimmed();
    if (stderrText.isEmpty() && result.crashed)
        stderrText = result.errorString;
    return failure(QStringLiteral("%1 failed: %2").arg(tool, stderrText));
}

} // namespace btp
