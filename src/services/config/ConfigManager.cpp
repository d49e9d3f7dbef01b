#include "services/config/ConfigManager.h"

#include <QFileInfo>
#include "services/config/ConfigBuilder.h"
#include "services/config/ConfigMutator.h"
#include "storage/ConfigIO.h"
#include "utils/Logger.h"

BaseConfig ConfigManager::loadOrCreate(const QString& outputPath,
                                       bool           appendMode,
                                       int            startPort) {
  BaseConfig base;
  base.config    = ConfigBuilder::buildBaseConfig();
  base.startPort = startPort;
  if (!appendMode || !QFileInfo::exists(outputPath)) {
    return base;
  }

  QString     error;
  QJsonObject existing = ConfigIO::loadConfig(outputPath, &error);
  if (!error.isEmpty()) {
    Logger::warn(QString("Error loading existing config file for appending: %1").arg(error));
    Logger::warn("Creating new configuration instead");
    return base;
  }
  Logger::info(QString("Loaded existing configuration from %1 for appending").arg(outputPath));
  ConfigMutator::normalize(existing);
  base.config    = existing;
  base.startPort = ConfigMutator::adjustStartPort(existing, startPort);
  base.appended  = true;
  return base;
}

bool ConfigManager::saveConfig(const QString& path, const QJsonObject& config, QString* error) {
  return ConfigIO::saveConfig(path, config, error);
}
