#include "core/YamlConfig.hpp"
#include <fstream>

namespace btp {

namespace {

// Maps recurse; scalars and sequences in the overlay replace the default.
YAML::Node overlayOnDefaults(const YAML::Node& defaults, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(defaults);
    if (!defaults.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node merged = YAML::Clone(defaults);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        merged[key] = merged[key] ? overlayOnDefaults(merged[key], it->second)
                                  : YAML::Clone(it->second);
    }
    return merged;
}

// Every key the defaults define must keep its node type after the overlay.
void checkShape(const YAML::Node& schema, const YAML::Node& node, const std::string& path)
{
    const std::string where = path.empty() ? std::string("document root") : "'" + path + "'";

    if (schema.IsMap()) {
        if (!node.IsMap())
            throw YAML::RepresentationException(node.Mark(), where + " must be a map");
        for (auto it = schema.begin(); it != schema.end(); ++it) {
            const std::string key = it->first.as<std::string>();
            checkShape(it->second, node[key], path.empty() ? key : path + "." + key);
        }
    } else if (schema.IsSequence()) {
        if (!node.IsSequence())
            throw YAML::RepresentationException(node.Mark(), where + " must be a list");
        for (const auto& item : node) {
            if (!item.IsScalar())
                throw YAML::RepresentationException(item.Mark(), where + " must list plain values");
        }
    } else if (schema.IsScalar() && !node.IsScalar()) {
        throw YAML::RepresentationException(node.Mark(), where + " must be a plain value");
    }
}

QVariant yamlScalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const QString s = QString::fromStdString(node.Scalar());

    if (s == QLatin1String("true")) return QVariant(true);
    if (s == QLatin1String("false")) return QVariant(false);

    bool intOk = false;
    int i = s.toInt(&intOk);
    if (intOk) return QVariant(i);

    return QVariant(s);
}

} // namespace

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["backends"]["order"] = YAML::Node(YAML::NodeType::Sequence);
    root_["backends"]["order"].push_back("pipewire");
    root_["backends"]["order"].push_back("pulseaudio");

    root_["pipewire"]["dump_command"] = "pw-dump";
    root_["pipewire"]["control_command"] = "wpctl";

    root_["pulseaudio"]["control_command"] = "pactl";

    root_["process"]["timeout_ms"] = -1;

    root_["logging"]["level"] = "warning";
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    YamlConfig tmp;
    return YAML::Clone(tmp.root_);
}

void YamlConfig::load(const QString& filePath)
{
    YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    const YAML::Node defaults = buildDefaultsNode();
    YAML::Node merged = overlayOnDefaults(defaults, loaded);
    checkShape(defaults, merged, {});
    root_ = merged;
}

void YamlConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    fout << root_;
}

// --- Backends ---

QStringList YamlConfig::backendOrder() const
{
    QStringList result;
    YAML::Node order = root_["backends"]["order"];
    if (order && order.IsSequence()) {
        for (const auto& item : order) {
            if (item.IsScalar())
                result.append(QString::fromStdString(item.as<std::string>()));
        }
    }
    return result;
}

void YamlConfig::setBackendOrder(const QStringList& v)
{
    YAML::Node seq(YAML::NodeType::Sequence);
    for (const auto& name : v)
        seq.push_back(name.toStdString());
    root_["backends"]["order"] = seq;
}

// --- PipeWire ---

QString YamlConfig::pipeWireDumpCommand() const
{
    return QString::fromStdString(root_["pipewire"]["dump_command"].as<std::string>("pw-dump"));
}

void YamlConfig::setPipeWireDumpCommand(const QString& v)
{
    root_["pipewire"]["dump_command"] = v.toStdString();
}

QString YamlConfig::pipeWireControlCommand() const
{
    return QString::fromStdString(root_["pipewire"]["control_command"].as<std::string>("wpctl"));
}

void YamlConfig::setPipeWireControlCommand(const QString& v)
{
    root_["pipewire"]["control_command"] = v.toStdString();
}

// --- PulseAudio ---

QString YamlConfig::pulseAudioControlCommand() const
{
    return QString::fromStdString(root_["pulseaudio"]["control_command"].as<std::string>("pactl"));
}

void YamlConfig::setPulseAudioControlCommand(const QString& v)
{
    root_["pulseaudio"]["control_command"] = v.toStdString();
}

// --- Process ---

int YamlConfig::processTimeoutMs() const
{
    return root_["process"]["timeout_ms"].as<int>(-1);
}

void YamlConfig::setProcessTimeoutMs(int v)
{
    root_["process"]["timeout_ms"] = v;
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("warning"));
}

void YamlConfig::setLogLevel(const QString& v)
{
    root_["logging"]["level"] = v.toStdString();
}

// --- Dot-path access ---

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : dottedKey.split('.')) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }

    return yamlScalarToVariant(node);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    const QStringList parts = dottedKey.split('.');

    // Only scalar keys that exist in the defaults may be written
    YAML::Node schema = buildDefaultsNode();
    for (const auto& part : parts) {
        if (!schema.IsMap()) return false;
        schema.reset(schema[part.toStdString()]);
        if (!schema.IsDefined()) return false;
    }
    if (!schema.IsScalar()) return false;

    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i)
        node.reset(node[parts[i].toStdString()]);

    const std::string leaf = parts.last().toStdString();
    switch (value.typeId()) {
    case QMetaType::Bool:
        node[leaf] = value.toBool();
        break;
    case QMetaType::Int:
        node[leaf] = value.toInt();
        break;
    default:
        node[leaf] = value.toString().toStdString();
        break;
    }

    return true;
}

} // namespace btp
