#include "PipeWireProfileBackend.hpp"
#include "core/process/ICommandRunner.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <boost/log/trivial.hpp>
#include <cmath>
#include <limits>
#include <utility>

namespace btp {

namespace {

const QString kAddressKey = QStringLiteral("api.bluez5.address");
const QString kEnumProfileKey = QStringLiteral("EnumProfile");
const QString kActiveProfileKey = QStringLiteral("Profile");
const QString kOffProfile = QStringLiteral("off");

// SPA params carry integers as JSON numbers. Anything that is not a whole
// number in uint32_t range is treated as absent.
std::optional<uint32_t> readIndex(const QJsonObject& obj, const QString& key)
{
    const QJsonValue v = obj.value(key);
    if (!v.isDouble())
        return std::nullopt;
    const double d = v.toDouble();
    if (d < 0 || d > std::numeric_limits<uint32_t>::max() || std::floor(d) != d)
        return std::nullopt;
    return static_cast<uint32_t>(d);
}

QList<AudioProfile> availableProfiles(const QJsonArray& enumProfiles)
{
    QList<AudioProfile> profiles;
    for (const auto& entryValue : enumProfiles) {
        const QJsonObject entry = entryValue.toObject();
        const auto index = readIndex(entry, QStringLiteral("index"));
        if (!index)
            continue;

        // name/description/available may be missing; a missing name is not "off"
        const QJsonValue name = entry.value(QStringLiteral("name"));
        if (name.isString() && name.toString() == kOffProfile)
            continue;
        if (entry.value(QStringLiteral("available")).toString() != QLatin1String("yes"))
            continue;

        AudioProfile p;
        p.index = *index;
        p.name = name.toString();
        p.description = entry.value(QStringLiteral("description")).toString();
        p.available = true;
        profiles.append(p);
    }
    return profiles;
}

} // namespace

PipeWireProfileBackend::PipeWireProfileBackend(ICommandRunner* runner,
                                               QString dumpCommand,
                                               QString controlCommand)
    : runner_(runner)
    , dumpCommand_(std::move(dumpCommand))
    , controlCommand_(std::move(controlCommand))
{
}

std::optional<AudioDevice> PipeWireProfileBackend::probe(const BluetoothAddress& address)
{
    const CommandResult result = runner_->run(dumpCommand_, {});
    if (!result.succeeded()) {
        BOOST_LOG_TRIVIAL(debug) << "[PipeWire] " << dumpCommand_.toStdString()
                                 << " unavailable: exit=" << result.exitCode
                                 << " " << result.errorString.toStdString();
        return std::nullopt;
    }
    return parseDump(result.standardOutput, address);
}

std::optional<AudioDevice> PipeWireProfileBackend::parseDump(const QByteArray& json,
                                                             const BluetoothAddress& address)
{
    if (!address.isValid())
        return std::nullopt;

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError || !doc.isArray()) {
        BOOST_LOG_TRIVIAL(debug) << "[PipeWire] unparsable dump: "
                                 << err.errorString().toStdString();
        return std::nullopt;
    }

    const QString wanted = address.toBluezFormat();

    for (const auto& value : doc.array()) {
        const QJsonObject object = value.toObject();
        const auto id = readIndex(object, QStringLiteral("id"));
        if (!id)
            continue;

        const QJsonObject info = object.value(QStringLiteral("info")).toObject();
        const QJsonValue addrValue =
            info.value(QStringLiteral("props")).toObject().value(kAddressKey);
        if (!addrValue.isString())
            continue;
        if (normalizeAddress(addrValue.toString()) != wanted)
            continue;

        if (!info.value(QStringLiteral("params")).isObject())
            continue;
        const QJsonObject params = info.value(QStringLiteral("params")).toObject();

        const QJsonArray enumProfiles = params.value(kEnumProfileKey).toArray();
        if (enumProfiles.isEmpty())
            continue;

        AudioDevice device;
        device.id = AudioDeviceId::pipeWire(*id);
        device.profiles = availableProfiles(enumProfiles);
        if (device.profiles.isEmpty()) {
            BOOST_LOG_TRIVIAL(debug) << "[PipeWire] object " << *id
                                     << " matches but has no available profile";
            continue;
        }

        const QJsonArray active = params.value(kActiveProfileKey).toArray();
        if (!active.isEmpty())
            device.activeProfileIndex = readIndex(active.first().toObject(), QStringLiteral("index"));

        BOOST_LOG_TRIVIAL(info) << "[PipeWire] device " << *id << " owns "
                                << address.toString().toStdString() << " ("
                                << device.profiles.size() << " profiles)";
        return device;
    }

    return std::nullopt;
}

ProfileSwitchResult PipeWireProfileBackend::switchProfile(const AudioDeviceId& id,
                                                          uint32_t profileIndex,
                                                          const QString& /*profileName*/)
{
    const QStringList args = {
        QStringLiteral("set-profile"),
        QString::number(id.objectId),
        QString::number(profileIndex),
    };
    const CommandResult result = runner_->run(controlCommand_, args);
    ProfileSwitchResult out = ProfileSwitchResult::fromCommand(controlCommand_, result);

    if (out.ok)
        BOOST_LOG_TRIVIAL(info) << "[PipeWire] device " << id.objectId
                                << " -> profile " << profileIndex;
    else
        BOOST_LOG_TRIVIAL(warning) << "[PipeWire] " << out.message.toStdString();
    return out;
}

} // namespace btp
