#include "services/region/RepresentativeSelector.h"
#include <algorithm>
#include "storage/ConfigConstants.h"
#include "utils/Logger.h"

namespace {
QString remarksOf(const QJsonObject& node) {
  return node.value(ConfigConstants::KEY_REMARKS).toString();
}

// Code point order; QString::operator< compares UTF-16 units, which puts
// astral characters (emoji, flags) before U+E000..U+FFFF.
bool remarksLess(const QString& a, const QString& b) {
  const QList<uint> lhs = a.toUcs4();
  const QList<uint> rhs = b.toUcs4();
  return std::lexicographical_compare(lhs.cbegin(), lhs.cend(), rhs.cbegin(), rhs.cend());
}
}  // namespace

namespace RepresentativeSelector {
QList<RegionEntry> sortBucket(const QList<RegionEntry>& bucket) {
  QList<RegionEntry> sorted = bucket;
  std::stable_sort(sorted.begin(), sorted.end(), [](const RegionEntry& a, const RegionEntry& b) {
    if (a.startsWithRegion != b.startsWithRegion) {
      return a.startsWithRegion;
    }
    return remarksLess(remarksOf(a.node), remarksOf(b.node));
  });
  return sorted;
}

QList<QJsonObject> selectFromBucket(const QList<RegionEntry>& bucket) {
  QList<QJsonObject> selected;
  if (bucket.isEmpty()) {
    return selected;
  }
  const QList<RegionEntry> sorted = sortBucket(bucket);
  selected.append(sorted.first().node);
  if (sorted.size() > 1) {
    selected.append(sorted.last().node);
  }
  return selected;
}

QList<QJsonObject> selectNodes(const RegionBuckets& buckets) {
  QList<QJsonObject> selected;
  for (auto it = buckets.cbegin(); it != buckets.cend(); ++it) {
    const QList<QJsonObject> picked = selectFromBucket(it.value());
    for (const auto& node : picked) {
      Logger::info(QString("  - Selected node from %1: %2").arg(it.key(), remarksOf(node)));
    }
    if (picked.size() > 1) {
      Logger::info(QString("  - Total: Selected %1 nodes from %2").arg(picked.size()).arg(it.key()));
    }
    selected.append(picked);
  }
  return selected;
}
}  // namespace RepresentativeSelector
