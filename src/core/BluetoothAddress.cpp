#include "core/BluetoothAddress.hpp"
#include <QStringList>

namespace btp {

namespace {

constexpr int kOctetCount = 6;

bool isHexDigit(QChar c)
{
    return (c >= QLatin1Char('0') && c <= QLatin1Char('9'))
        || (c >= QLatin1Char('A') && c <= QLatin1Char('F'));
}

QString joinOctets(const QString& octets, QChar separator)
{
    QString out;
    out.reserve(kOctetCount * 3 - 1);
    for (int i = 0; i < kOctetCount; ++i) {
        if (i > 0)
            out += separator;
        out += octets.mid(i * 2, 2);
    }
    return out;
}

} // namespace

BluetoothAddress BluetoothAddress::fromString(const QString& text)
{
    const QString normalized = normalizeAddress(text.trimmed());
    const QStringList parts = normalized.split(QLatin1Char('_'));
    if (parts.size() != kOctetCount)
        return {};

    QString octets;
    for (const auto& part : parts) {
        if (part.size() != 2 || !isHexDigit(part[0]) || !isHexDigit(part[1]))
            return {};
        octets += part;
    }

    BluetoothAddress addr;
    addr.octets_ = octets;
    return addr;
}

QString BluetoothAddress::toString() const
{
    if (!isValid()) return {};
    return joinOctets(octets_, QLatin1Char(':'));
}

QString BluetoothAddress::toBluezFormat() const
{
    if (!isValid()) return {};
    return joinOctets(octets_, QLatin1Char('_'));
}

QString normalizeAddress(const QString& address)
{
    QString out = address.toUpper();
    out.replace(QLatin1Char(':'), QLatin1Char('_'));
    return out;
}

} // namespace btp
