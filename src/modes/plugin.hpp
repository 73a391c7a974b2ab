#pragma once

#include <QCommandLineParser>
#include <QCoreApplication>

namespace modes {

    // Runs the seabird plugin until a termination signal or a fatal error.
    // Returns the process exit code.
    int runPlugin(QCoreApplication& app, const QCommandLineParser& parser);

} // namespace modes
