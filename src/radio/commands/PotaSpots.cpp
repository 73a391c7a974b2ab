#include "PotaSpots.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QTimeZone>

#include <cmath>
#include <cstdlib>

namespace sbr::radio::pota {

    namespace {

        struct ModeName {
            Mode        mode;
            const char* name;
        };

        constexpr ModeName MODE_NAMES[] = {
            {Mode::FT4, "FT4"},   {Mode::FT8, "FT8"},     {Mode::SSB, "SSB"},     {Mode::USB, "USB"},
            {Mode::LSB, "LSB"},   {Mode::CW, "CW"},       {Mode::FM, "FM"},       {Mode::RTTY, "RTTY"},
            {Mode::C4FM, "C4FM"}, {Mode::PSK31, "PSK31"}, {Mode::DSTAR, "DSTAR"},
        };

    } // namespace

    std::optional<Mode> parseMode(const QString& value) {
        const QString upper = value.trimmed().toUpper();
        for (const auto& entry : MODE_NAMES) {
            if (upper == QLatin1String(entry.name)) {
                return entry.mode;
            }
        }
        return std::nullopt;
    }

    Mode modeFromApi(const QString& value) {
        return parseMode(value).value_or(Mode::Unknown);
    }

    QString modeName(Mode mode) {
        for (const auto& entry : MODE_NAMES) {
            if (entry.mode == mode) {
                return QString::fromLatin1(entry.name);
            }
        }
        return "unknown";
    }

    const QList<Band>& knownBands() {
        static const QList<Band> bands = {
            {"160m", 1800000, 2000000},     {"80m", 3500000, 4000000},     {"60m", 5330500, 5406400},
            {"40m", 7000000, 7300000},      {"30m", 10100000, 10150000},   {"20m", 14000000, 14350000},
            {"17m", 18068000, 18168000},    {"15m", 21000000, 21450000},   {"12m", 24890000, 24990000},
            {"10m", 28000000, 29700000},    {"6m", 50000000, 54000000},    {"2m", 144000000, 148000000},
        };
        return bands;
    }

    std::optional<Band> parseBand(const QString& value) {
        const QString lower = value.trimmed().toLower();
        for (const auto& band : knownBands()) {
            if (band.name == lower) {
                return band;
            }
        }
        return std::nullopt;
    }

    std::optional<qint64> parseFrequencyKhz(const QString& value) {
        bool         ok  = false;
        const double khz = value.trimmed().toDouble(&ok);
        if (!ok || khz < 0 || !std::isfinite(khz)) {
            return std::nullopt;
        }
        return static_cast<qint64>(std::floor(khz * 1000.0));
    }

    QString formatFrequency(qint64 hz) {
        const qint64 mhz       = hz / 1000000;
        const qint64 khz       = (hz % 1000000) / 1000;
        const qint64 remainder = hz % 1000;
        return QString("%1.%2%3").arg(mhz).arg(khz, 3, 10, QChar('0')).arg(remainder == 500 ? QStringLiteral(".5") : QString());
    }

    QString formatAge(qint64 seconds) {
        seconds = std::abs(seconds);
        if (seconds > 60) {
            return QString("%1m%2s").arg(seconds / 60).arg(seconds % 60);
        }
        return QString::number(seconds);
    }

    std::optional<QList<Activation>> parseSpots(const QByteArray& payload, QString* error) {
        QJsonParseError parseError;
        const auto      doc = QJsonDocument::fromJson(payload, &parseError);
        if (parseError.error != QJsonParseError::NoError) {
            if (error) {
                *error = QString("malformed spot JSON: %1").arg(parseError.errorString());
            }
            return std::nullopt;
        }
        if (!doc.isArray()) {
            if (error) {
                *error = "spot JSON is not an array";
            }
            return std::nullopt;
        }

        QList<Activation> spots;
        for (const auto& value : doc.array()) {
            const QJsonObject obj       = value.toObject();
            const auto        frequency = parseFrequencyKhz(obj.value("frequency").toString());
            if (!frequency) {
                continue;
            }

            const QDateTime parsed = QDateTime::fromString(obj.value("spotTime").toString(), Qt::ISODate);
            if (!parsed.isValid()) {
                continue;
            }

            Activation spot;
            spot.activator   = obj.value("activator").toString();
            spot.park        = obj.value("name").toString();
            spot.location    = obj.value("locationDesc").toString();
            spot.mode        = modeFromApi(obj.value("mode").toString());
            spot.frequencyHz = *frequency;
            spot.spotTime    = QDateTime(parsed.date(), parsed.time(), QTimeZone::utc());
            spots.append(spot);
        }
        return spots;
    }

    std::optional<Activation> mostRecentActivation(const QList<Activation>& spots, const Band& band, Mode mode) {
        for (const auto& spot : spots) {
            if (band.contains(spot.frequencyHz) && spot.mode == mode) {
                return spot;
            }
        }
        return std::nullopt;
    }

    QString formatActivation(const Activation& activation, qint64 nowMs) {
        const qint64 ageSeconds = (nowMs - activation.spotTime.toMSecsSinceEpoch()) / 1000;
        return QString("[time:%1 UTC,age:%2] %3MHz %4, %5 - %6 (%7)")
            .arg(activation.spotTime.toString("yyyy-MM-dd HH:mm:ss"), formatAge(ageSeconds), formatFrequency(activation.frequencyHz), modeName(activation.mode),
                 activation.location, activation.park, activation.activator);
    }

} // namespace sbr::radio::pota
