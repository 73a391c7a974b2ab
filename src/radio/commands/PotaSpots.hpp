#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QString>

#include <optional>

namespace sbr::radio::pota {

    enum class Mode {
        Unknown,
        FT4,
        FT8,
        SSB,
        USB,
        LSB,
        CW,
        FM,
        RTTY,
        C4FM,
        PSK31,
        DSTAR
    };

    // User input, case-insensitive. "unknown" is not a mode a user can ask for.
    [[nodiscard]] std::optional<Mode> parseMode(const QString& value);
    // Spot API values. Anything unrecognised, including "", is Mode::Unknown.
    [[nodiscard]] Mode                modeFromApi(const QString& value);
    [[nodiscard]] QString             modeName(Mode mode);

    struct Band {
        QString name;
        qint64  lowHz  = 0;
        qint64  highHz = 0;

        [[nodiscard]] bool contains(qint64 hz) const {
            return hz >= lowHz && hz <= highHz;
        }
    };

    [[nodiscard]] const QList<Band>& knownBands();
    [[nodiscard]] std::optional<Band> parseBand(const QString& value);

    // "14.074" (kHz string) -> 14074000 Hz, rounded down to whole Hz
    [[nodiscard]] std::optional<qint64> parseFrequencyKhz(const QString& value);
    // 14074000 -> "14.074", 7074500 -> "7.074.5"
    [[nodiscard]] QString               formatFrequency(qint64 hz);
    // Whole seconds up to a minute, "<m>m<s>s" beyond
    [[nodiscard]] QString               formatAge(qint64 seconds);

    struct Activation {
        QString   activator;
        QString   park;
        QString   location;
        Mode      mode        = Mode::Unknown;
        qint64    frequencyHz = 0;
        QDateTime spotTime; // UTC
    };

    // Spots that cannot be read are skipped. std::nullopt if the payload is not a JSON array.
    std::optional<QList<Activation>> parseSpots(const QByteArray& payload, QString* error = nullptr);

    // First spot in feed order on the band in the given mode
    [[nodiscard]] std::optional<Activation> mostRecentActivation(const QList<Activation>& spots, const Band& band, Mode mode);

    [[nodiscard]] QString formatActivation(const Activation& activation, qint64 nowMs);

} // namespace sbr::radio::pota
