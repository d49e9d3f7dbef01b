#include "app/CommandLine.h"
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>

namespace CommandLine {

ParseStatus parse(const QStringList &arguments,
                  Arguments *parsed,
                  QString *error,
                  QString *helpText)
{
    auto fail = [error](const QString &message) {
        if (error) {
            *error = message;
        }
        return ParseStatus::Error;
    };

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QCoreApplication::translate("main", "Convert Shadowsocks configuration to V2Ray configuration"));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();

    const QCommandLineOption inputOption(
        QStringList() << "i" << "input", "Input Shadowsocks JSON file", "file",
        ConfigConstants::DEFAULT_INPUT_FILE);
    const QCommandLineOption outputOption(
        QStringList() << "o" << "output", "Output V2Ray config file", "file",
        ConfigConstants::DEFAULT_OUTPUT_FILE);
    const QCommandLineOption portOption(
        QStringList() << "p" << "port", "Starting port number", "port",
        QString::number(ConfigConstants::DEFAULT_START_PORT));
    const QCommandLineOption appendOption(
        QStringList() << "a" << "append",
        "Append to existing config file instead of creating a new one");
    const QCommandLineOption dockerOption(
        QStringList() << "d" << "docker", "Docker Compose file to update with port mappings", "file",
        ConfigConstants::DEFAULT_COMPOSE_FILE);
    const QCommandLineOption noDockerOption("no-docker", "Do not touch the Docker Compose file");
    const QCommandLineOption serviceOption(
        "service", "Docker Compose service whose port mapping is rewritten", "name",
        ConfigConstants::DEFAULT_COMPOSE_SERVICE);
    const QCommandLineOption markerOption(
        "info-marker", "Additional remarks marker of informational nodes (repeatable)", "text");
    const QCommandLineOption logFileOption("log-file", "Also append log lines to this file", "file");
    const QCommandLineOption verboseOption("verbose", "Print debug log lines");

    parser.addOption(inputOption);
    parser.addOption(outputOption);
    parser.addOption(portOption);
    parser.addOption(appendOption);
    parser.addOption(dockerOption);
    parser.addOption(noDockerOption);
    parser.addOption(serviceOption);
    parser.addOption(markerOption);
    parser.addOption(logFileOption);
    parser.addOption(verboseOption);

    if (helpText) {
        *helpText = parser.helpText();
    }
    if (!parser.parse(arguments)) {
        return fail(parser.errorText());
    }
    if (parser.isSet(helpOption)) {
        return ParseStatus::HelpRequested;
    }
    if (parser.isSet(versionOption)) {
        return ParseStatus::VersionRequested;
    }
    if (!parser.positionalArguments().isEmpty()) {
        return fail(QString("Unexpected argument: %1").arg(parser.positionalArguments().first()));
    }

    Arguments result;
    result.options.inputPath = parser.value(inputOption);
    result.options.outputPath = parser.value(outputOption);
    if (result.options.inputPath.trimmed().isEmpty()) {
        return fail("Input file must not be empty");
    }
    if (result.options.outputPath.trimmed().isEmpty()) {
        return fail("Output file must not be empty");
    }

    bool ok = false;
    const int port = parser.value(portOption).toInt(&ok);
    if (!ok || port < ConfigConstants::MIN_PORT || port > ConfigConstants::MAX_PORT) {
        return fail(QString("Invalid port '%1': expected %2-%3")
                        .arg(parser.value(portOption))
                        .arg(ConfigConstants::MIN_PORT)
                        .arg(ConfigConstants::MAX_PORT));
    }
    result.options.startPort = port;
    result.options.appendMode = parser.isSet(appendOption);
    result.options.composePath = parser.isSet(noDockerOption) ? QString() : parser.value(dockerOption);
    result.options.composeService = parser.value(serviceOption).trimmed();
    if (result.options.composeService.isEmpty()) {
        return fail("Service name must not be empty");
    }
    for (const QString &marker : parser.values(markerOption)) {
        if (!marker.isEmpty() && !result.options.infoMarkers.contains(marker)) {
            result.options.infoMarkers.append(marker);
        }
    }
    result.logFile = parser.value(logFileOption);
    result.verbose = parser.isSet(verboseOption);

    if (parsed) {
        *parsed = result;
    }
    return ParseStatus::Ok;
}

} // namespace CommandLine
