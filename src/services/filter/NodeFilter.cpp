#include "services/filter/NodeFilter.h"
#include <QVariant>
#include "storage/ConfigConstants.h"
#include "utils/Logger.h"

namespace NodeFilter {
bool isInfoRemarks(const QString& remarks, const QStringList& markers) {
  for (const QString& marker : markers) {
    if (!marker.isEmpty() && remarks.contains(marker)) {
      return true;
    }
  }
  return false;
}

bool hasServerFields(const QJsonObject& node) {
  const QJsonValue server = node.value(ConfigConstants::KEY_SERVER);
  if (!server.isString() || server.toString().trimmed().isEmpty()) return false;
  const int port = node.value(ConfigConstants::KEY_PORT).toVariant().toInt();
  if (port <= 0 || port > ConfigConstants::MAX_PORT) return false;
  if (!node.value(ConfigConstants::KEY_METHOD).isString()) return false;
  if (!node.value(ConfigConstants::KEY_PASSWORD).isString()) return false;
  return true;
}

QList<QJsonObject> filterInfoNodes(const QJsonArray&  nodes,
                                   const QStringList& markers,
                                   Stats*             stats) {
  Stats              counts;
  QList<QJsonObject> valid;
  for (const auto& item : nodes) {
    const QJsonObject node    = item.toObject();
    const QString     remarks = node.value(ConfigConstants::KEY_REMARKS).toString();
    if (remarks.isEmpty()) {
      counts.missingRemarks++;
      continue;
    }
    if (isInfoRemarks(remarks, markers)) {
      counts.infoNodes++;
      Logger::debug(QString("Skipping info node '%1'").arg(remarks));
      continue;
    }
    if (!hasServerFields(node)) {
      counts.incomplete++;
      Logger::debug(QString("Skipping incomplete node '%1'").arg(remarks));
      continue;
    }
    valid.append(node);
  }
  counts.kept = valid.size();
  if (stats) {
    *stats = counts;
  }

  Logger::info(QString("Found %1 valid nodes after filtering info nodes").arg(counts.kept));
  if (counts.missingRemarks > 0 || counts.incomplete > 0) {
    Logger::debug(QString("Dropped %1 nodes without remarks and %2 incomplete nodes")
                      .arg(counts.missingRemarks)
                      .arg(counts.incomplete));
  }
  return valid;
}
}  // namespace NodeFilter
