#ifndef COMMANDLINE_H
#define COMMANDLINE_H

#include <QString>
#include <QStringList>
#include "services/convert/Converter.h"

namespace CommandLine {
enum class ParseStatus {
    Ok,
    HelpRequested,
    VersionRequested,
    Error
};

struct Arguments {
    ConverterOptions options;
    bool verbose = false;
    QString logFile;
};

// arguments[0] is the program name, as in QCoreApplication::arguments().
ParseStatus parse(const QStringList &arguments,
                  Arguments *parsed,
                  QString *error = nullptr,
                  QString *helpText = nullptr);
} // namespace CommandLine

#endif // COMMANDLINE_H
