#ifndef REPRESENTATIVESELECTOR_H
#define REPRESENTATIVESELECTOR_H
#include <QJsonObject>
#include <QList>
#include "models/RegionEntry.h"

namespace RepresentativeSelector {
// Entries starting with the region first, then by remarks. Stable.
QList<RegionEntry> sortBucket(const QList<RegionEntry>& bucket);
// One node for a single-entry bucket, otherwise the first and last after
// sorting. Two selections may refer to the same record.
QList<QJsonObject> selectFromBucket(const QList<RegionEntry>& bucket);
// Buckets are visited in key order.
QList<QJsonObject> selectNodes(const RegionBuckets& buckets);
}  // namespace RepresentativeSelector
#endif  // REPRESENTATIVESELECTOR_H
