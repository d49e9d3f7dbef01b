#ifndef REGIONEXTRACTOR_H
#define REGIONEXTRACTOR_H
#include <QJsonObject>
#include <QList>
#include <QStringList>

class RegionMatcher;

namespace RegionExtractor {
// Distinct candidate regions found in the labels, sorted lexicographically.
QStringList extractRegions(const QList<QJsonObject>& nodes, const RegionMatcher& matcher);
}  // namespace RegionExtractor
#endif  // REGIONEXTRACTOR_H
