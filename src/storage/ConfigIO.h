#ifndef CONFIGIO_H
#define CONFIGIO_H
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
namespace ConfigIO {
// Reads a JSON array of server records. Non-object elements are skipped.
bool        loadServerList(const QString& path, QJsonArray* servers, QString* error = nullptr);
// Returns an empty object when the file is missing, unreadable or not a JSON object.
QJsonObject loadConfig(const QString& path, QString* error = nullptr);
// Atomic: the previous file stays intact unless the whole document is committed.
bool        saveConfig(const QString& path, const QJsonObject& config, QString* error = nullptr);
}  // namespace ConfigIO
#endif  // CONFIGIO_H
