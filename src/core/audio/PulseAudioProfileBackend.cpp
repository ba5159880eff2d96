#include "PulseAudioProfileBackend.hpp"
#include "core/process/ICommandRunner.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <boost/log/trivial.hpp>
#include <utility>

namespace btp {

namespace {

const QString kOffProfile = QStringLiteral("off");

struct CardProfile {
    QString name;
    QString description;
    bool available = false;
};

// Older pactl builds emit "profiles" as an array of {name, description, available};
// current ones emit an object keyed by profile name. QJsonObject iterates its
// keys sorted, so the object form comes out in name order.
QList<CardProfile> readCardProfiles(const QJsonValue& value)
{
    QList<CardProfile> out;
    if (value.isArray()) {
        for (const auto& v : value.toArray()) {
            const QJsonObject o = v.toObject();
            out.append(CardProfile{o.value(QStringLiteral("name")).toString(),
                                   o.value(QStringLiteral("description")).toString(),
                                   o.value(QStringLiteral("available")).toBool(false)});
        }
    } else if (value.isObject()) {
        const QJsonObject profiles = value.toObject();
        for (auto it = profiles.constBegin(); it != profiles.constEnd(); ++it) {
            const QJsonObject o = it.value().toObject();
            out.append(CardProfile{it.key(),
                                   o.value(QStringLiteral("description")).toString(),
                                   o.value(QStringLiteral("available")).toBool(false)});
        }
    }
    return out;
}

std::optional<QString> cardAddress(const QJsonObject& properties)
{
    for (const auto& key : {QStringLiteral("api.bluez5.address"), QStringLiteral("device.string")}) {
        const QJsonValue v = properties.value(key);
        if (v.isString())
            return normalizeAddress(v.toString());
    }
    return std::nullopt;
}

} // namespace

PulseAudioProfileBackend::PulseAudioProfileBackend(ICommandRunner* runner, QString controlCommand)
    : runner_(runner)
    , controlCommand_(std::move(controlCommand))
{
}

std::optional<AudioDevice> PulseAudioProfileBackend::probe(const BluetoothAddress& address)
{
    const QStringList args = {
        QStringLiteral("--format=json"),
        QStringLiteral("list"),
        QStringLiteral("cards"),
    };
    const CommandResult result = runner_->run(controlCommand_, args);
    if (!result.succeeded()) {
        BOOST_LOG_TRIVIAL(debug) << "[PulseAudio] " << controlCommand_.toStdString()
                                 << " unavailable: exit=" << result.exitCode
                                 << " " << result.errorString.toStdString();
        return std::nullopt;
    }
    return parseCards(result.standardOutput, address);
}

std::optional<AudioDevice> PulseAudioProfileBackend::parseCards(const QByteArray& json,
                                                                const BluetoothAddress& address)
{
    if (!address.isValid())
        return std::nullopt;

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError || !doc.isArray()) {
        BOOST_LOG_TRIVIAL(debug) << "[PulseAudio] unparsable card list: "
                                 << err.errorString().toStdString();
        return std::nullopt;
    }

    const QString wanted = address.toBluezFormat();

    for (const auto& value : doc.array()) {
        const QJsonObject card = value.toObject();
        const QString cardName = card.value(QStringLiteral("name")).toString();

        const auto propAddress = cardAddress(card.value(QStringLiteral("properties")).toObject());
        const bool addressMatches = propAddress && *propAddress == wanted;
        // bluez_card.AA_BB_CC_DD_EE_FF
        const bool nameMatches = cardName.contains(wanted, Qt::CaseInsensitive);
        if (!addressMatches && !nameMatches)
            continue;

        AudioDevice device;
        device.id = AudioDeviceId::pulseAudio(cardName);

        for (const auto& cp : readCardProfiles(card.value(QStringLiteral("profiles")))) {
            if (cp.name == kOffProfile || !cp.available)
                continue;
            AudioProfile p;
            p.index = static_cast<uint32_t>(device.profiles.size());
            p.name = cp.name;
            p.description = cp.description;
            p.available = true;
            device.profiles.append(p);
        }

        if (device.profiles.isEmpty()) {
            BOOST_LOG_TRIVIAL(debug) << "[PulseAudio] card " << cardName.toStdString()
                                     << " matches but has no available profile";
            continue;
        }

        const QJsonValue activeName = card.value(QStringLiteral("active_profile"));
        if (activeName.isString()) {
            if (const AudioProfile* active = device.profileByName(activeName.toString()))
                device.activeProfileIndex = active->index;
        }

        BOOST_LOG_TRIVIAL(info) << "[PulseAudio] card " << cardName.toStdString() << " owns "
                                << address.toString().toStdString() << " ("
                                << device.profiles.size() << " profiles)";
        return device;
    }

    return std::nullopt;
}

ProfileSwitchResult PulseAudioProfileBackend::switchProfile(const AudioDeviceId& id,
                                                            uint32_t /*profileIndex*/,
                                                            const QString& profileName)
{
    const QStringList args = {
        QStringLiteral("set-card-profile"),
        id.cardName,
        profileName,
    };
    const CommandResult result = runner_->run(controlCommand_, args);
    ProfileSwitchResult out = ProfileSwitchResult::fromCommand(controlCommand_, result);

    if (out.ok)
        BOOST_LOG_TRIVIAL(info) << "[PulseAudio] card " << id.cardName.toStdString()
                                << " -> profile " << profileName.toStdString();
    else
        BOOST_LOG_TRIVIAL(warning) << "[PulseAudio] " << out.message.toStdString();
    return out;
}

} // namespace btp
