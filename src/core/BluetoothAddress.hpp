#pragma once

#include <QString>

namespace btp {

/// Bluetooth MAC address as used by BlueZ and the audio servers.
///
/// BlueZ reports addresses in colon form (AA:BB:CC:DD:EE:FF) while PipeWire
/// node names and PulseAudio card names embed them in underscore form
/// (bluez_card.AA_BB_CC_DD_EE_FF). Compare addresses only after both sides
/// went through normalizeAddress().
class BluetoothAddress {
public:
    BluetoothAddress() = default;

    /// Accepts colon or underscore form, case-insensitive.
    /// Returns an invalid address on malformed input.
    static BluetoothAddress fromString(const QString& text);

    bool isValid() const { return !octets_.isEmpty(); }

    /// AA:BB:CC:DD:EE:FF
    QString toString() const;

    /// AA_BB_CC_DD_EE_FF
    QString toBluezFormat() const;

    bool operator==(const BluetoothAddress& other) const { return octets_ == other.octets_; }
    bool operator!=(const BluetoothAddress& other) const { return !(*this == other); }

private:
    QString octets_;  // 12 upper-case hex digits, empty when invalid
};

/// Pure string transform: ':' -> '_', hex digits upper-cased.
/// Works on any string, including ones that are not well-formed addresses.
QString normalizeAddress(const QString& address);

} // namespace btp
