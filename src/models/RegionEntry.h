#ifndef REGIONENTRY_H
#define REGIONENTRY_H
#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QString>

struct RegionEntry {
  QJsonObject node;
  bool        startsWithRegion = false;
};

// Keyed by region name; QMap iteration keeps buckets in lexicographic order.
using RegionBuckets = QMap<QString, QList<RegionEntry>>;
#endif  // REGIONENTRY_H
