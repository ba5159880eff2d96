#pragma once

#include <QString>
#include <QStringList>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace btp {

class YamlConfig {
public:
    YamlConfig();

    /// Overlay the file on top of the built-in defaults.
    /// Throws YAML::Exception if the file is missing, malformed, or gives a
    /// known key the wrong type (e.g. a scalar where a section is expected).
    /// The current values are kept when it throws.
    void load(const QString& filePath);
    void save(const QString& filePath) const;

    // Backends, probed in this order
    QStringList backendOrder() const;
    void setBackendOrder(const QStringList& v);

    // PipeWire tools
    QString pipeWireDumpCommand() const;
    void setPipeWireDumpCommand(const QString& v);
    QString pipeWireControlCommand() const;
    void setPipeWireControlCommand(const QString& v);

    // PulseAudio tool
    QString pulseAudioControlCommand() const;
    void setPulseAudioControlCommand(const QString& v);

    // Child process timeout, -1 = wait forever
    int processTimeoutMs() const;
    void setProcessTimeoutMs(int v);

    // trace, debug, info, warning, error, fatal
    QString logLevel() const;
    void setLogLevel(const QString& v);

    // Generic dot-path access (e.g. "pipewire.dump_command")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;

    void initDefaults();
    static YAML::Node buildDefaultsNode();
};

} // namespace btp
