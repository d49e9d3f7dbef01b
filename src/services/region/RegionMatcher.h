#ifndef REGIONMATCHER_H
#define REGIONMATCHER_H
#include <QRegularExpression>
#include <QString>

// Guesses a region name from a node label. An empty result means no region.
class RegionMatcher {
 public:
  virtual ~RegionMatcher()                                    = default;
  virtual QString inferRegion(const QString& remarks) const  = 0;
  // Leading-label guess used when no known region occurs in a label.
  virtual QString prefixRegion(const QString& remarks) const = 0;
};

/**
 * @brief Two-stage text heuristic.
 *
 * Stage one reads a leading run of letters and spaces terminated by a hyphen
 * or a digit ("HK-01", "Japan 3"). Stage two looks anywhere in the label for
 * letters and spaces followed by a hyphen or space and a number
 * ("[VIP] Singapore 02"). Candidates of a single character are rejected.
 */
class PatternRegionMatcher : public RegionMatcher {
 public:
  PatternRegionMatcher();
  QString inferRegion(const QString& remarks) const override;
  QString prefixRegion(const QString& remarks) const override;
  QString embeddedRegion(const QString& remarks) const;

 private:
  static QString acceptCandidate(const QRegularExpressionMatch& match);
  QRegularExpression m_prefixPattern;
  QRegularExpression m_embeddedPattern;
};
#endif  // REGIONMATCHER_H
