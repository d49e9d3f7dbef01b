#ifndef COMPOSEPORTPATCHER_H
#define COMPOSEPORTPATCHER_H

#include <QList>
#include <QString>

namespace ComposePortPatcher {
enum class PatchResult {
    Updated,
    Skipped,
    Failed
};

// "{min}-{max}:{min}-{max}"; the fallback port stands in for an empty list.
QString formatPortRange(const QList<int> &ports, int fallbackPort);
// Reads services.<service>.ports[0] of a docker-compose file.
QString readPortMapping(const QString &yamlContent, const QString &service, QString *error = nullptr);
// Rewrites the first port mapping of the service in place. Never fatal:
// problems are logged and reported as Skipped or Failed.
PatchResult patchPortRange(const QString &composePath,
                           const QString &service,
                           const QList<int> &ports,
                           int fallbackPort);
} // namespace ComposePortPatcher

#endif // COMPOSEPORTPATCHER_H
