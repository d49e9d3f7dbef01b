#ifndef NODEGROUPER_H
#define NODEGROUPER_H
#include <QJsonObject>
#include <QList>
#include <QStringList>
#include "models/RegionEntry.h"

class RegionMatcher;

namespace NodeGrouper {
// First region (in sorted order) contained in the label, else the matcher's
// prefix guess, else empty.
QString       matchRegion(const QString&       remarks,
                          const QStringList&   sortedRegions,
                          const RegionMatcher& matcher,
                          bool*                startsWithRegion = nullptr);
// Every node lands in exactly one bucket; unmatched nodes go to "Other".
RegionBuckets groupByRegion(const QList<QJsonObject>& nodes,
                            const QStringList&        regions,
                            const RegionMatcher&      matcher);
}  // namespace NodeGrouper
#endif  // NODEGROUPER_H
