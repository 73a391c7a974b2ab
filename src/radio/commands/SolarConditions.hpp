#pragma once

#include <QByteArray>
#include <QMap>
#include <QString>
#include <QStringList>

#include <optional>

namespace sbr::radio::solar {

    struct BandCondition {
        QString day;
        QString night;
    };

    struct SolarReport {
        QString                      updated;
        QMap<QString, BandCondition> bands; // keyed by band name, lexical order
    };

    // Parses the HamQSL solar XML feed. Every band needs exactly one day and one night value.
    std::optional<SolarReport> parseSolarXml(const QByteArray& payload, QString* error = nullptr);

    // "updated <when>" followed by one "<band> - day: <d>, night: <n>" line per band
    QStringList                formatSolarReport(const SolarReport& report);

} // namespace sbr::radio::solar
