#include "services/convert/Converter.h"

#include "services/config/ConfigManager.h"
#include "services/config/ConfigMutator.h"
#include "services/deploy/ComposePortPatcher.h"
#include "services/filter/NodeFilter.h"
#include "services/region/NodeGrouper.h"
#include "services/region/RegionExtractor.h"
#include "services/region/RegionMatcher.h"
#include "services/region/RepresentativeSelector.h"
#include "storage/ConfigIO.h"
#include "utils/Logger.h"

Converter::Converter()
    : m_ownedMatcher(std::make_unique<PatternRegionMatcher>()), m_matcher(m_ownedMatcher.get()) {}

Converter::Converter(const RegionMatcher& matcher) : m_matcher(&matcher) {}

Converter::~Converter() = default;

ConversionResult Converter::convert(const ConverterOptions& options) const {
  ConversionResult result;

  QJsonArray servers;
  if (!ConfigIO::loadServerList(options.inputPath, &servers, &result.error)) {
    Logger::error(QString("Error loading input file: %1").arg(result.error));
    return result;
  }

  const QList<QJsonObject> validNodes = NodeFilter::filterInfoNodes(servers, options.infoMarkers);
  const QStringList        regions    = RegionExtractor::extractRegions(validNodes, *m_matcher);
  const RegionBuckets      buckets    = NodeGrouper::groupByRegion(validNodes, regions, *m_matcher);
  const QList<QJsonObject> selected   = RepresentativeSelector::selectNodes(buckets);

  BaseConfig base =
      ConfigManager::loadOrCreate(options.outputPath, options.appendMode, options.startPort);
  ConfigMutator::injectNodes(base.config, selected, base.startPort);
  ConfigMutator::appendDirectOutbound(base.config);

  if (!ConfigManager::saveConfig(options.outputPath, base.config, &result.error)) {
    Logger::error(QString("Error writing output file: %1").arg(result.error));
    return result;
  }

  result.ok          = true;
  result.nodeCount   = selected.size();
  result.regionCount = buckets.size();

  if (!options.composePath.isEmpty()) {
    const auto patched = ComposePortPatcher::patchPortRange(options.composePath,
                                                            options.composeService,
                                                            ConfigMutator::inboundPorts(base.config),
                                                            base.startPort);
    if (patched == ComposePortPatcher::PatchResult::Failed) {
      Logger::warn(QString("%1 was written; %2 keeps its previous port mappings")
                       .arg(options.outputPath, options.composePath));
    }
  }
  return result;
}
