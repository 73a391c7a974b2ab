#include "RadioCommands.hpp"

#include "../../common/Constants.hpp"
#include "../../common/Logging.hpp"
#include "PotaSpots.hpp"
#include "SolarConditions.hpp"

#include <utility>

namespace sbr::radio {

    using core::CommandEnvelope;
    using core::CommandResult;
    using core::CommandSpec;
    using core::ReplyFn;

    core::CommandSpec bandsCommand(RadioClient& client) {
        CommandSpec spec;
        spec.info.name      = "bands";
        spec.info.shortHelp = "show HAM RF band conditions";
        spec.info.fullHelp  = "show HAM RF band conditions as reported by HamQSL";
        spec.info.usage     = "bands";
        spec.info.minArgs   = 0;
        spec.info.maxArgs   = 0;

        spec.handler = [&client](const CommandEnvelope& envelope, ReplyFn reply) {
            const QString prefix = core::replyPrefix(envelope.source);

            client.query(SOLAR_KEY, [prefix, reply = std::move(reply)](RadioReply data) {
                if (!data.ok()) {
                    reply(CommandResult::failure(*data.error));
                    return;
                }

                QString    error;
                const auto report = solar::parseSolarXml(data.payload, &error);
                if (!report) {
                    reply(CommandResult::failure(ErrorKind::Internal, "band conditions: " + error));
                    return;
                }

                QStringList lines;
                lines << prefix + "current band conditions:";
                lines << solar::formatSolarReport(*report);
                reply(CommandResult::success(lines));
            });
        };
        return spec;
    }

    core::CommandSpec potaCommand(RadioClient& client, std::function<qint64()> nowFn) {
        CommandSpec spec;
        spec.info.name      = "pota";
        spec.info.shortHelp = "find most recent POTA activation";
        spec.info.fullHelp  = "find the most recent Parks on the Air activation. Usage: pota <band> [mode]. Default mode is SSB.";
        spec.info.usage     = "pota <band> [mode]";
        spec.info.minArgs   = 1;
        spec.info.maxArgs   = 2;

        spec.handler = [&client, nowFn = std::move(nowFn)](const CommandEnvelope& envelope, ReplyFn reply) {
            const auto band = pota::parseBand(envelope.args.value(0));
            if (!band) {
                reply(CommandResult::failure(ErrorKind::BadArguments, "invalid band"));
                return;
            }

            const auto mode = envelope.args.size() > 1 ? pota::parseMode(envelope.args.at(1)) : std::optional(pota::Mode::SSB);
            if (!mode) {
                reply(CommandResult::failure(ErrorKind::BadArguments, "invalid mode"));
                return;
            }

            const QString prefix = core::replyPrefix(envelope.source);

            client.query(POTA_SPOTS_KEY, [prefix, band = *band, mode = *mode, nowFn, reply = std::move(reply)](RadioReply data) {
                if (!data.ok()) {
                    reply(CommandResult::failure(*data.error));
                    return;
                }

                QString    error;
                const auto spots = pota::parseSpots(data.payload, &error);
                if (!spots) {
                    reply(CommandResult::failure(ErrorKind::Internal, "pota spots: " + error));
                    return;
                }

                const auto activation = pota::mostRecentActivation(*spots, band, mode);
                if (!activation) {
                    reply(CommandResult::success({prefix + QString("no activations found on %1 over %2").arg(band.name, pota::modeName(mode))}));
                    return;
                }

                qCDebug(lcRadio) << "pota match for" << band.name << "from" << spots->size() << "spots";
                reply(CommandResult::success({prefix + pota::formatActivation(*activation, nowFn())}));
            });
        };
        return spec;
    }

    bool registerRadioCommands(core::CommandRegistry::Builder& builder, RadioClient& client, std::function<qint64()> nowFn) {
        bool ok = builder.add(bandsCommand(client));
        ok      = builder.add(potaCommand(client, std::move(nowFn))) && ok;
        return ok;
    }

} // namespace sbr::radio
