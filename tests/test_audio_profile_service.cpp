#include <QtTest>
#include "core/YamlConfig.hpp"
#include "core/audio/AudioProfileService.hpp"
#include "core/audio/PipeWireProfileBackend.hpp"
#include "core/audio/PulseAudioProfileBackend.hpp"
#include "core/process/ICommandRunner.hpp"

class ScriptedCommandRunner : public btp::ICommandRunner {
public:
    btp::CommandResult run(const QString& program, const QStringList& arguments) override {
        calls_.append(QStringList{program} + arguments);
        return results_.value(program);
    }

    void reply(const QString& program, int exitCode, const QByteArray& out, const QByteArray& err = {}) {
        btp::CommandResult r;
        r.started = true;
        r.exitCode = exitCode;
        r.standardOutput = out;
        r.standardError = err;
        results_[program] = r;
    }

    QStringList programsRun() const {
        QStringList out;
        for (const auto& c : calls_)
            out.append(c.first());
        return out;
    }

    QMap<QString, btp::CommandResult> results_;
    QList<QStringList> calls_;
};

static QByteArray readFixture(const QString& name)
{
    QFile f(QString(TEST_DATA_DIR) + "/" + name);
    if (!f.open(QIODevice::ReadOnly))
        qFatal("missing fixture %s", qPrintable(name));
    return f.readAll();
}

static std::unique_ptr<btp::AudioProfileService> makeService(btp::ICommandRunner* runner)
{
    auto service = std::make_unique<btp::AudioProfileService>();
    service->addBackend(std::make_unique<btp::PipeWireProfileBackend>(runner));
    service->addBackend(std::make_unique<btp::PulseAudioProfileBackend>(runner));
    return service;
}

static const auto kHeadphones = btp::BluetoothAddress::fromString("AA:BB:CC:DD:EE:FF");

class TestAudioProfileService : public QObject {
    Q_OBJECT
private slots:
    void testPipeWireWinsWhenItHasTheDevice();
    void testFallsBackWhenPipeWireMissing();
    void testFallsBackOnMalformedDump();
    void testFallsBackWhenPipeWireHasNoMatch();
    void testNothingFound();
    void testInvalidAddressRunsNothing();
    void testSwitchDispatchesToPipeWire();
    void testSwitchDispatchesToPulseAudio();
    void testSwitchFailureReported();
    void testSwitchWithoutOwningBackend();
    void testFromConfigDefaultOrder();
    void testFromConfigCustomOrderAndCommands();
    void testFromConfigSkipsUnknownAndDuplicates();
};

void TestAudioProfileService::testPipeWireWinsWhenItHasTheDevice()
{
    ScriptedCommandRunner runner;
    runner.reply("pw-dump", 0, readFixture("pw_dump.json"));
    runner.reply("pactl", 0, readFixture("pactl_cards.json"));
    auto service = makeService(&runner);

    auto device = service->discover(kHeadphones);
    QVERIFY(device.has_value());
    QVERIFY(device->id.backend == btp::AudioBackend::PipeWire);
    QCOMPARE(runner.programsRun(), QStringList{"pw-dump"});
}

void TestAudioProfileService::testFallsBackWhenPipeWireMissing()
{
    ScriptedCommandRunner runner;  // no pw-dump result: failed to start
    runner.reply("pactl", 0, readFixture("pactl_cards.json"));
    auto service = makeService(&runner);

    auto device = service->discover(kHeadphones);
    QVERIFY(device.has_value());
    QVERIFY(device->id.backend == btp::AudioBackend::PulseAudio);
    QCOMPARE(device->id.cardName, QString("bluez_card.AA_BB_CC_DD_EE_FF"));
    QCOMPARE(runner.programsRun(), (QStringList{"pw-dump", "pactl"}));
}

void TestAudioProfileService::testFallsBackOnMalformedDump()
{
    ScriptedCommandRunner runner;
    runner.reply("pw-dump", 0, "[{ truncated");
    runner.reply("pactl", 0, readFixture("pactl_cards.json"));
    auto service = makeService(&runner);

    auto device = service->discover(kHeadphones);
    QVERIFY(device.has_value());
    QVERIFY(device->id.backend == btp::AudioBackend::PulseAudio);
}

void TestAudioProfileService::testFallsBackWhenPipeWireHasNoMatch()
{
    ScriptedCommandRunner runner;
    runner.reply("pw-dump", 0, readFixture("pw_dump.json"));
    runner.reply("pactl", 0, readFixture("pactl_cards.json"));
    auto service = makeService(&runner);

    // Only present in the PulseAudio card list
    auto device = service->discover(btp::BluetoothAddress::fromString("77:88:99:AA:BB:CC"));
    QVERIFY(device.has_value());
    QCOMPARE(device->id.cardName, QString("bt-speaker"));
}

void TestAudioProfileService::testNothingFound()
{
    ScriptedCommandRunner runner;
    runner.reply("pw-dump", 1, {}, "Host is down");
    runner.reply("pactl", 1, {}, "Connection refused");
    auto service = makeService(&runner);

    QVERIFY(!service->discover(kHeadphones));
    QCOMPARE(runner.programsRun(), (QStringList{"pw-dump", "pactl"}));
}

void TestAudioProfileService::testInvalidAddressRunsNothing()
{
    ScriptedCommandRunner runner;
    auto service = makeService(&runner);

    QVERIFY(!service->discover(btp::BluetoothAddress::fromString("not-an-address")));
    QVERIFY(runner.calls_.isEmpty());
}

void TestAudioProfileService::testSwitchDispatchesToPipeWire()
{
    ScriptedCommandRunner runner;
    runner.reply("pw-dump", 0, readFixture("pw_dump.json"));
    runner.reply("wpctl", 0, {});
    auto service = makeService(&runner);

    auto device = service->discover(kHeadphones);
    QVERIFY(device.has_value());
    const auto* hfp = device->profileByName("headset-head-unit");
    QVERIFY(hfp);

    auto result = service->switchProfile(*device, *hfp);
    QVERIFY(result.ok);
    QCOMPARE(result.message, QString("Profile switched"));
    QCOMPARE(runner.calls_.last(), (QStringList{"wpctl", "set-profile", "42", "4"}));
}

void TestAudioProfileService::testSwitchDispatchesToPulseAudio()
{
    ScriptedCommandRunner runner;
    runner.reply("pactl", 0, readFixture("pactl_cards.json"));
    auto service = makeService(&runner);

    auto device = service->discover(kHeadphones);
    QVERIFY(device.has_value());

    auto result = service->switchProfile(*device, 0, "a2dp_sink");
    QVERIFY(result.ok);
    QCOMPARE(runner.calls_.last(),
             (QStringList{"pactl", "set-card-profile", "bluez_card.AA_BB_CC_DD_EE_FF", "a2dp_sink"}));
}

void TestAudioProfileService::testSwitchFailureReported()
{
    ScriptedCommandRunner runner;
    runner.reply("wpctl", 255, {}, "Profile index 9 out of range");
    auto service = makeService(&runner);

    btp::AudioDevice device;
    device.id = btp::AudioDeviceId::pipeWire(42);

    auto result = service->switchProfile(device, 9, "bogus");
    QVERIFY(!result.ok);
    QVERIFY(result.message.contains("Profile index 9 out of range"));
}

void TestAudioProfileService::testSwitchWithoutOwningBackend()
{
    ScriptedCommandRunner runner;
    btp::AudioProfileService service;
    service.addBackend(std::make_unique<btp::PipeWireProfileBackend>(&runner));

    btp::AudioDevice device;
    device.id = btp::AudioDeviceId::pulseAudio("bluez_card.AA_BB_CC_DD_EE_FF");

    auto result = service.switchProfile(device, 0, "a2dp_sink");
    QVERIFY(!result.ok);
    QCOMPARE(result.message, QString("No backend available for pulseaudio"));
    QVERIFY(runner.calls_.isEmpty());
}

void TestAudioProfileService::testFromConfigDefaultOrder()
{
    ScriptedCommandRunner runner;
    btp::YamlConfig config;
    auto service = btp::AudioProfileService::fromConfig(config, &runner);

    QVERIFY(service->backends()
            == (QList<btp::AudioBackend>{btp::AudioBackend::PipeWire, btp::AudioBackend::PulseAudio}));
}

void TestAudioProfileService::testFromConfigCustomOrderAndCommands()
{
    ScriptedCommandRunner runner;
    runner.reply("/opt/pa/bin/pactl", 0, readFixture("pactl_cards.json"));

    btp::YamlConfig config;
    config.setBackendOrder({"pulseaudio", "pipewire"});
    config.setPulseAudioControlCommand("/opt/pa/bin/pactl");
    auto service = btp::AudioProfileService::fromConfig(config, &runner);

    auto device = service->discover(kHeadphones);
    QVERIFY(device.has_value());
    QVERIFY(device->id.backend == btp::AudioBackend::PulseAudio);
    QCOMPARE(runner.programsRun(), QStringList{"/opt/pa/bin/pactl"});
}

void TestAudioProfileService::testFromConfigSkipsUnknownAndDuplicates()
{
    ScriptedCommandRunner runner;
    btp::YamlConfig config;
    config.setBackendOrder({"jack", "PipeWire", "pipewire"});
    auto service = btp::AudioProfileService::fromConfig(config, &runner);

    QVERIFY(service->backends() == QList<btp::AudioBackend>{btp::AudioBackend::PipeWire});
}

QTEST_MAIN(TestAudioProfileService)
#include "test_audio_profile_service.moc"
