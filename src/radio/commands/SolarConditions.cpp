#include "SolarConditions.hpp"

#include <QHash>
#include <QXmlStreamReader>

namespace sbr::radio::solar {

    namespace {

        struct PartialCondition {
            std::optional<QString> day;
            std::optional<QString> night;
        };

        std::optional<SolarReport> fail(QString* error, const QString& message) {
            if (error) {
                *error = message;
            }
            return std::nullopt;
        }

    } // namespace

    std::optional<SolarReport> parseSolarXml(const QByteArray& payload, QString* error) {
        QXmlStreamReader                  xml(payload);
        QStringList                       path;
        std::optional<QString>            updated;
        QHash<QString, PartialCondition>  partial;

        while (!xml.atEnd()) {
            const auto token = xml.readNext();
            if (token == QXmlStreamReader::EndElement) {
                if (!path.isEmpty()) {
                    path.removeLast();
                }
                continue;
            }
            if (token != QXmlStreamReader::StartElement) {
                continue;
            }

            const QString name   = xml.name().toString();
            const QString parent = path.isEmpty() ? QString() : path.last();

            if (name == "updated" && parent == "solardata") {
                updated = xml.readElementText().trimmed();
                continue;
            }

            if (name == "band" && parent == "calculatedconditions") {
                const auto    attributes = xml.attributes();
                const QString band       = attributes.value("name").toString();
                const QString time       = attributes.value("time").toString();
                const QString condition  = xml.readElementText().trimmed();
                auto&         entry      = partial[band];

                if (time == "day") {
                    if (entry.day) {
                        return fail(error, QString("day conditions for band %1 already set").arg(band));
                    }
                    entry.day = condition;
                } else if (time == "night") {
                    if (entry.night) {
                        return fail(error, QString("night conditions for band %1 already set").arg(band));
                    }
                    entry.night = condition;
                } else {
                    return fail(error, QString("unknown time %1 for band %2").arg(time, band));
                }
                continue;
            }

            path.append(name);
        }

        if (xml.hasError()) {
            return fail(error, QString("malformed solar XML: %1").arg(xml.errorString()));
        }
        if (!updated) {
            return fail(error, "solar XML has no solardata/updated element");
        }

        SolarReport report;
        report.updated = *updated;
        for (auto it = partial.cbegin(); it != partial.cend(); ++it) {
            if (!it->day) {
                return fail(error, QString("missing day value for band %1").arg(it.key()));
            }
            if (!it->night) {
                return fail(error, QString("missing night value for band %1").arg(it.key()));
            }
            report.bands.insert(it.key(), BandCondition{*it->day, *it->night});
        }
        return report;
    }

    QStringList formatSolarReport(const SolarReport& report) {
        QStringList lines;
        lines << QString("updated %1").arg(report.updated);
        for (auto it = report.bands.cbegin(); it != report.bands.cend(); ++it) {
            lines << QString("%1 - day: %2, night: %3").arg(it.key(), it->day, it->night);
        }
        return lines;
    }

} // namespace sbr::radio::solar
