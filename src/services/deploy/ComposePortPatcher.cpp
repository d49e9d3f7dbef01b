#include "services/deploy/ComposePortPatcher.h"
#include "utils/Logger.h"
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <algorithm>
#include <yaml-cpp/yaml.h>

namespace ComposePortPatcher {

QString formatPortRange(const QList<int> &ports, int fallbackPort)
{
    int minPort = fallbackPort;
    int maxPort = fallbackPort;
    if (!ports.isEmpty()) {
        minPort = *std::min_element(ports.cbegin(), ports.cend());
        maxPort = *std::max_element(ports.cbegin(), ports.cend());
    }
    return QString("%1-%2:%1-%2").arg(minPort).arg(maxPort);
}

QString readPortMapping(const QString &yamlContent, const QString &service, QString *error)
{
    auto fail = [error](const QString &message) -> QString {
        if (error) {
            *error = message;
        }
        return QString();
    };

    try {
        const YAML::Node root = YAML::Load(yamlContent.toStdString());
        const YAML::Node services = root["services"];
        if (!services || !services.IsMap()) {
            return fail("no 'services' section");
        }
        const YAML::Node serviceNode = services[service.toStdString()];
        if (!serviceNode || !serviceNode.IsMap()) {
            return fail(QString("service '%1' not found").arg(service));
        }
        const YAML::Node ports = serviceNode["ports"];
        if (!ports || !ports.IsSequence() || ports.size() == 0 || !ports[0].IsScalar()) {
            return fail(QString("service '%1' has no port mappings").arg(service));
        }
        return QString::fromStdString(ports[0].as<std::string>());
    } catch (const YAML::Exception &e) {
        return fail(QString("invalid YAML: %1").arg(QString::fromUtf8(e.what())));
    }
}

PatchResult patchPortRange(const QString &composePath,
                           const QString &service,
                           const QList<int> &ports,
                           int fallbackPort)
{
    if (!QFileInfo::exists(composePath)) {
        Logger::warn(QString("Docker Compose file '%1' not found, port mappings will not be updated")
                         .arg(composePath));
        return PatchResult::Skipped;
    }

    QFile file(composePath);
    if (!file.open(QIODevice::ReadOnly)) {
        Logger::warn(QString("Error reading Docker Compose file %1: %2").arg(composePath, file.errorString()));
        return PatchResult::Failed;
    }
    QString content = QString::fromUtf8(file.readAll());
    file.close();

    QString error;
    const QString current = readPortMapping(content, service, &error);
    if (current.isEmpty()) {
        Logger::warn(QString("Docker Compose file %1 not updated: %2").arg(composePath, error));
        return PatchResult::Skipped;
    }

    const QString mapping = formatPortRange(ports, fallbackPort);
    if (current == mapping) {
        Logger::info(QString("Docker Compose port mappings already set to %1").arg(mapping));
        return PatchResult::Updated;
    }
    if (!content.contains(current)) {
        Logger::warn(QString("Port mapping '%1' not found verbatim in %2").arg(current, composePath));
        return PatchResult::Failed;
    }
    content.replace(current, mapping);

    QSaveFile out(composePath);
    if (!out.open(QIODevice::WriteOnly)) {
        Logger::warn(QString("Error updating Docker Compose file %1: %2").arg(composePath, out.errorString()));
        return PatchResult::Failed;
    }
    out.write(content.toUtf8());
    if (!out.commit()) {
        Logger::warn(QString("Error updating Docker Compose file %1: %2").arg(composePath, out.errorString()));
        return PatchResult::Failed;
    }
    Logger::info(QString("Updated Docker Compose port mappings to %1").arg(mapping));
    return PatchResult::Updated;
}

} // namespace ComposePortPatcher
