#include "services/region/NodeGrouper.h"
#include <algorithm>
#include "services/region/RegionMatcher.h"
#include "storage/ConfigConstants.h"
#include "utils/Logger.h"

namespace NodeGrouper {
QString matchRegion(const QString&       remarks,
                    const QStringList&   sortedRegions,
                    const RegionMatcher& matcher,
                    bool*                startsWithRegion) {
  for (const auto& region : sortedRegions) {
    if (remarks.contains(region)) {
      if (startsWithRegion) {
        *startsWithRegion = remarks.startsWith(region);
      }
      return region;
    }
  }
  const QString guessed = matcher.prefixRegion(remarks);
  if (startsWithRegion) {
    *startsWithRegion = !guessed.isEmpty();
  }
  return guessed;
}

RegionBuckets groupByRegion(const QList<QJsonObject>& nodes,
                            const QStringList&        regions,
                            const RegionMatcher&      matcher) {
  QStringList sortedRegions = regions;
  std::sort(sortedRegions.begin(), sortedRegions.end());

  RegionBuckets buckets;
  for (const auto& node : nodes) {
    const QString remarks = node.value(ConfigConstants::KEY_REMARKS).toString();
    if (remarks.isEmpty()) {
      continue;
    }
    RegionEntry entry;
    entry.node           = node;
    const QString region = matchRegion(remarks, sortedRegions, matcher, &entry.startsWithRegion);
    if (region.isEmpty()) {
      entry.startsWithRegion = false;
      buckets[ConfigConstants::REGION_OTHER].append(entry);
      Logger::info(QString("Node with remarks '%1' assigned to '%2' region")
                       .arg(remarks, ConfigConstants::REGION_OTHER));
      continue;
    }
    buckets[region].append(entry);
  }

  Logger::info(QString("Grouped nodes into %1 regions").arg(buckets.size()));
  for (auto it = buckets.cbegin(); it != buckets.cend(); ++it) {
    Logger::info(QString("  - %1: %2 nodes").arg(it.key()).arg(it.value().size()));
  }
  return buckets;
}
}  // namespace NodeGrouper
