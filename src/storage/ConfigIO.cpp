#include "storage/ConfigIO.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include "utils/Logger.h"

namespace {
void setError(QString* error, const QString& message) {
  if (error) {
    *error = message;
  }
}

bool readJsonDocument(const QString& path, QJsonDocument* doc, QString* error) {
  QFile file(path);
  if (!file.exists()) {
    setError(error, QString("File '%1' not found").arg(path));
    return false;
  }
  if (!file.open(QIODevice::ReadOnly)) {
    setError(error, QString("Failed to open '%1': %2").arg(path, file.errorString()));
    return false;
  }
  const QByteArray content = file.readAll();
  file.close();
  QJsonParseError parseError;
  *doc = QJsonDocument::fromJson(content, &parseError);
  if (parseError.error != QJsonParseError::NoError) {
    setError(error, QString("'%1' is not valid JSON: %2 at offset %3")
                        .arg(path, parseError.errorString())
                        .arg(parseError.offset));
    return false;
  }
  return true;
}
}  // namespace

namespace ConfigIO {
bool loadServerList(const QString& path, QJsonArray* servers, QString* error) {
  QJsonDocument doc;
  if (!readJsonDocument(path, &doc, error)) {
    return false;
  }
  if (!doc.isArray()) {
    setError(error, QString("'%1' does not contain a JSON array of servers").arg(path));
    return false;
  }
  QJsonArray result;
  int        skipped = 0;
  for (const auto& item : doc.array()) {
    if (!item.isObject()) {
      ++skipped;
      continue;
    }
    result.append(item);
  }
  if (skipped > 0) {
    Logger::debug(QString("Skipped %1 non-object entries in %2").arg(skipped).arg(path));
  }
  *servers = result;
  Logger::info(QString("Successfully loaded %1 nodes from %2").arg(result.size()).arg(path));
  return true;
}

QJsonObject loadConfig(const QString& path, QString* error) {
  QJsonDocument doc;
  if (!readJsonDocument(path, &doc, error)) {
    return QJsonObject();
  }
  if (!doc.isObject()) {
    setError(error, QString("'%1' does not contain a JSON object").arg(path));
    return QJsonObject();
  }
  return doc.object();
}

bool saveConfig(const QString& path, const QJsonObject& config, QString* error) {
  QSaveFile file(path);
  if (!file.open(QIODevice::WriteOnly)) {
    setError(error, QString("Failed to write config file %1: %2").arg(path, file.errorString()));
    return false;
  }
  QJsonDocument doc(config);
  file.write(doc.toJson(QJsonDocument::Indented));
  if (!file.commit()) {
    setError(error, QString("Failed to commit config file %1: %2").arg(path, file.errorString()));
    return false;
  }
  Logger::info(QString("Config saved: %1").arg(path));
  return true;
}
}  // namespace ConfigIO
