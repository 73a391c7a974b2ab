#include "common/Config.hpp"
#include "common/Constants.hpp"
#include "modes/plugin.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName(sbr::PLUGIN_NAME);
    app.setApplicationVersion(SBR_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Seabird chat plugin answering HAM radio questions (band conditions, POTA activations).\n"
                                     "The core token is read from SEABIRD_TOKEN.");
    parser.addHelpOption();
    parser.addVersionOption();
    sbr::Config::addOptions(parser);

    parser.process(app);

    return modes::runPlugin(app, parser);
}
