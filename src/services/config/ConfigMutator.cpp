#include "services/config/ConfigMutator.h"
#include <algorithm>
#include "services/config/ConfigBuilder.h"
#include "storage/ConfigConstants.h"
#include "utils/Logger.h"

namespace {
bool isDirectOutbound(const QJsonValue& value) {
  if (!value.isObject()) return false;
  return value.toObject().value("tag").toString() == ConfigConstants::TAG_DIRECT;
}
}  // namespace

void ConfigMutator::normalize(QJsonObject& config) {
  if (!config.value("inbounds").isArray()) {
    config["inbounds"] = QJsonArray();
  }
  QJsonArray outbounds;
  int        removed = 0;
  for (const auto& ob : config.value("outbounds").toArray()) {
    if (isDirectOutbound(ob)) {
      ++removed;
      continue;
    }
    outbounds.append(ob);
  }
  config["outbounds"] = outbounds;
  if (removed > 0) {
    Logger::debug(QString("Removed %1 existing '%2' outbound(s)").arg(removed).arg(ConfigConstants::TAG_DIRECT));
  }
  QJsonObject routing = config.value("routing").toObject();
  if (!routing.value("rules").isArray()) {
    routing["rules"] = QJsonArray();
  }
  if (routing.value("domainStrategy").toString().isEmpty()) {
    routing["domainStrategy"] = ConfigConstants::DOMAIN_STRATEGY;
  }
  config["routing"] = routing;
}

QList<int> ConfigMutator::inboundPorts(const QJsonObject& config) {
  QList<int> ports;
  for (const auto& inVal : config.value("inbounds").toArray()) {
    if (!inVal.isObject()) continue;
    const QJsonValue port = inVal.toObject().value("port");
    if (!port.isDouble()) continue;
    const double value = port.toDouble();
    if (value < ConfigConstants::MIN_PORT || value > ConfigConstants::MAX_PORT) {
      Logger::debug(QString("Ignoring inbound with out-of-range port %1").arg(value));
      continue;
    }
    ports.append(static_cast<int>(value));
  }
  return ports;
}

int ConfigMutator::adjustStartPort(const QJsonObject& config, int startPort) {
  const QList<int> used = inboundPorts(config);
  if (used.isEmpty()) {
    return startPort;
  }
  const int maxUsed = *std::max_element(used.cbegin(), used.cend());
  if (startPort <= maxUsed) {
    Logger::info(QString("Adjusted start port to %1 to avoid conflicts").arg(maxUsed + 1));
    return maxUsed + 1;
  }
  return startPort;
}

QList<int> ConfigMutator::injectNodes(QJsonObject& config, const QList<QJsonObject>& nodes, int startPort) {
  QJsonArray  inbounds  = config.value("inbounds").toArray();
  QJsonArray  outbounds = config.value("outbounds").toArray();
  QJsonObject routing   = config.value("routing").toObject();
  QJsonArray  rules     = routing.value("rules").toArray();
  QList<int>  assigned;
  int         port = startPort;
  for (const auto& node : nodes) {
    inbounds.append(ConfigBuilder::buildInbound(node, port));
    outbounds.append(ConfigBuilder::buildOutbound(node, port));
    rules.append(ConfigBuilder::buildRoutingRule(node, port));
    assigned.append(port);
    ++port;
  }
  if (!assigned.isEmpty() && assigned.last() > ConfigConstants::MAX_PORT) {
    Logger::warn(QString("Allocated ports exceed %1 (last port %2)").arg(ConfigConstants::MAX_PORT).arg(assigned.last()));
  }
  routing["rules"]    = rules;
  config["inbounds"]  = inbounds;
  config["outbounds"] = outbounds;
  config["routing"]   = routing;
  return assigned;
}

void ConfigMutator::appendDirectOutbound(QJsonObject& config) {
  QJsonArray outbounds = config.value("outbounds").toArray();
  outbounds.append(ConfigBuilder::buildDirectOutbound());
  config["outbounds"] = outbounds;
}
