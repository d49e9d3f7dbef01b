#ifndef CONVERTER_H
#define CONVERTER_H

#include <QString>
#include <QStringList>
#include <memory>
#include "storage/ConfigConstants.h"

struct ConverterOptions {
  QString     inputPath      = ConfigConstants::DEFAULT_INPUT_FILE;
  QString     outputPath     = ConfigConstants::DEFAULT_OUTPUT_FILE;
  int         startPort      = ConfigConstants::DEFAULT_START_PORT;
  bool        appendMode     = false;
  // Empty disables the docker-compose patch.
  QString     composePath    = ConfigConstants::DEFAULT_COMPOSE_FILE;
  QString     composeService = ConfigConstants::DEFAULT_COMPOSE_SERVICE;
  QStringList infoMarkers    = ConfigConstants::defaultInfoMarkers();
};

struct ConversionResult {
  bool    ok          = false;
  int     nodeCount   = 0;
  int     regionCount = 0;
  QString error;
};

class RegionMatcher;

class Converter {
 public:
  Converter();
  // The matcher must outlive the converter.
  explicit Converter(const RegionMatcher& matcher);
  ~Converter();

  // Load, filter, group, select, write, then patch the compose file.
  // Nothing is written when loading fails; node and region counts are zero
  // whenever the result is not ok.
  ConversionResult convert(const ConverterOptions& options) const;

 private:
  Converter(const Converter&)            = delete;
  Converter& operator=(const Converter&) = delete;

  std::unique_ptr<RegionMatcher> m_ownedMatcher;
  const RegionMatcher*           m_matcher;
};

#endif  // CONVERTER_H
