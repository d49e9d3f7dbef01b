#include "services/region/RegionMatcher.h"

PatternRegionMatcher::PatternRegionMatcher()
    : m_prefixPattern(QStringLiteral("^([A-Za-z\\s]+)[\\-\\d]"),
                      QRegularExpression::UseUnicodePropertiesOption),
      m_embeddedPattern(QStringLiteral("([A-Za-z\\s]+)[\\-\\s]\\d+"),
                        QRegularExpression::UseUnicodePropertiesOption) {}

QString PatternRegionMatcher::acceptCandidate(const QRegularExpressionMatch& match) {
  if (!match.hasMatch()) {
    return QString();
  }
  const QString region = match.captured(1).trimmed();
  if (region.length() <= 1) {
    return QString();
  }
  return region;
}

QString PatternRegionMatcher::prefixRegion(const QString& remarks) const {
  return acceptCandidate(m_prefixPattern.match(remarks));
}

QString PatternRegionMatcher::embeddedRegion(const QString& remarks) const {
  return acceptCandidate(m_embeddedPattern.match(remarks));
}

QString PatternRegionMatcher::inferRegion(const QString& remarks) const {
  const QString region = prefixRegion(remarks);
  if (!region.isEmpty()) {
    return region;
  }
  return embeddedRegion(remarks);
}
