#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QJsonObject>
#include <QString>

struct BaseConfig {
  QJsonObject config;
  int         startPort = 0;
  bool        appended  = false;
};

class ConfigManager {
 public:
  // Uses the existing output as base in append mode, a fresh template otherwise.
  static BaseConfig loadOrCreate(const QString& outputPath, bool appendMode, int startPort);
  static bool       saveConfig(const QString& path, const QJsonObject& config, QString* error = nullptr);
};

#endif  // CONFIGMANAGER_H
