#include "services/region/RegionExtractor.h"
#include <QSet>
#include <algorithm>
#include "services/region/RegionMatcher.h"
#include "storage/ConfigConstants.h"
#include "utils/Logger.h"

namespace RegionExtractor {
QStringList extractRegions(const QList<QJsonObject>& nodes, const RegionMatcher& matcher) {
  QSet<QString> candidates;
  for (const auto& node : nodes) {
    const QString remarks = node.value(ConfigConstants::KEY_REMARKS).toString();
    if (remarks.isEmpty()) {
      continue;
    }
    const QString region = matcher.inferRegion(remarks);
    if (!region.isEmpty()) {
      candidates.insert(region);
    }
  }
  QStringList regions(candidates.cbegin(), candidates.cend());
  std::sort(regions.begin(), regions.end());
  Logger::info(QString("Detected %1 possible regions from node names").arg(regions.size()));
  if (!regions.isEmpty()) {
    Logger::info(QString("  - Detected regions: %1").arg(regions.join(", ")));
  }
  return regions;
}
}  // namespace RegionExtractor
