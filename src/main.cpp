#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QTextStream>
#include <memory>
#include "core/BluetoothAddress.hpp"
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/audio/AudioProfileService.hpp"
#include "core/process/ProcessCommandRunner.hpp"

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitUsage = 1,
    ExitNoDevice = 2,
    ExitNoProfile = 3,
    ExitSwitchFailed = 4
};

void printDevice(QTextStream& out, const btp::AudioDevice& device)
{
    out << btp::backendName(device.id.backend) << " device " << device.id.toString() << "\n";
    for (const auto& p : device.profiles) {
        const bool active = device.activeProfileIndex && *device.activeProfileIndex == p.index;
        out << (active ? "[*] " : "[ ] ") << p.index << "  " << p.name;
        if (!p.description.isEmpty())
            out << "  " << p.description;
        out << "\n";
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("btprofile");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "List and switch the audio profile of a Bluetooth device on PipeWire or PulseAudio.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "YAML config file.", "file");
    QCommandLineOption verboseOption({"v", "verbose"}, "Enable debug logging.");
    QCommandLineOption backendOption("backend",
        "Only probe this backend (pipewire or pulseaudio).", "name");
    parser.addOption(configOption);
    parser.addOption(verboseOption);
    parser.addOption(backendOption);
    parser.addPositionalArgument("address", "Bluetooth address, AA:BB:CC:DD:EE:FF.");
    parser.addPositionalArgument("profile", "Profile name or index to activate.", "[profile]");
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty() || args.size() > 2) {
        err << parser.helpText();
        return ExitUsage;
    }

    // --- Configuration ---
    btp::YamlConfig config;
    QString configPath = parser.value(configOption);
    const bool explicitConfig = !configPath.isEmpty();
    if (!explicitConfig)
        configPath = QDir::homePath() + "/.config/btprofile/config.yaml";
    QString configError;
    if (explicitConfig || QFile::exists(configPath)) {
        try {
            config.load(configPath);
        } catch (const YAML::Exception& e) {
            configError = QString::fromStdString(e.what());
        }
    }

    // --- Logging ---
    auto level = boost::log::trivial::warning;
    if (!btp::parseLogLevel(config.logLevel(), level))
        err << "Unknown logging.level '" << config.logLevel() << "', using warning\n";
    if (parser.isSet(verboseOption))
        level = boost::log::trivial::debug;
    btp::initLogging(level);

    if (!configError.isEmpty()) {
        BOOST_LOG_TRIVIAL(error) << "[main] Failed to load " << configPath.toStdString()
                                 << ": " << configError.toStdString() << ", using defaults";
    }

    if (parser.isSet(backendOption)) {
        const QString name = parser.value(backendOption);
        if (!btp::backendFromName(name)) {
            err << "Unknown backend: " << name << "\n";
            return ExitUsage;
        }
        config.setBackendOrder({name});
    }

    const auto address = btp::BluetoothAddress::fromString(args.at(0));
    if (!address.isValid()) {
        err << "Invalid Bluetooth address: " << args.at(0) << "\n";
        return ExitUsage;
    }

    // --- Discovery ---
    btp::ProcessCommandRunner runner(config.processTimeoutMs());
    auto service = btp::AudioProfileService::fromConfig(config, &runner);

    const auto device = service->discover(address);
    if (!device) {
        err << "No controllable audio profile found for " << address.toString() << "\n";
        return ExitNoDevice;
    }

    if (args.size() == 1) {
        printDevice(out, *device);
        return ExitOk;
    }

    // --- Switch ---
    const auto* profile = device->resolveProfile(args.at(1));
    if (!profile) {
        err << "Profile not available: " << args.at(1) << "\n";
        printDevice(err, *device);
        return ExitNoProfile;
    }

    const auto result = service->switchProfile(*device, *profile);
    if (!result.ok) {
        err << result.message << "\n";
        return ExitSwitchFailed;
    }

    out << result.message << ": " << profile->name << "\n";
    return ExitOk;
}
