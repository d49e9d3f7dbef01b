#include <QCoreApplication>
#include <QTextStream>

#include "app/CommandLine.h"
#include "services/convert/Converter.h"
#include "utils/Logger.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("ss2v2ray");
    app.setApplicationVersion("1.0.0");

    QTextStream out(stdout);
    QTextStream err(stderr);

    CommandLine::Arguments args;
    QString error;
    QString helpText;
    switch (CommandLine::parse(app.arguments(), &args, &error, &helpText)) {
    case CommandLine::ParseStatus::HelpRequested:
        out << helpText;
        return 0;
    case CommandLine::ParseStatus::VersionRequested:
        out << app.applicationName() << " " << app.applicationVersion() << Qt::endl;
        return 0;
    case CommandLine::ParseStatus::Error:
        err << error << Qt::endl << Qt::endl << helpText;
        return 2;
    case CommandLine::ParseStatus::Ok:
        break;
    }

    Logger::instance().setVerbose(args.verbose);
    if (!Logger::instance().init(args.logFile)) {
        Logger::warn("Continuing with console logging only");
    }

    Converter converter;
    const ConversionResult result = converter.convert(args.options);

    // Summary
    const QString mode = args.options.appendMode ? "appended to" : "generated";
    out << QString("Config %1: %2 with %3 nodes from %4 regions")
               .arg(mode, args.options.outputPath)
               .arg(result.nodeCount)
               .arg(result.regionCount)
        << Qt::endl;

    Logger::instance().close();
    return result.ok ? 0 : 1;
}
