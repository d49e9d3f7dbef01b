#include "services/config/ConfigBuilder.h"
#include <QVariant>
#include "storage/ConfigConstants.h"

namespace {
QString makeTag(const QString& prefix, const QJsonObject& node, int port) {
  return QString("%1-%2-%3")
      .arg(prefix)
      .arg(port)
      .arg(node.value(ConfigConstants::KEY_REMARKS).toString());
}
}  // namespace

QJsonObject ConfigBuilder::buildBaseConfig() {
  QJsonObject config;
  config["inbounds"]  = QJsonArray();
  config["outbounds"] = QJsonArray();
  config["routing"]   = buildRoutingConfig();
  return config;
}

QJsonObject ConfigBuilder::buildRoutingConfig() {
  QJsonObject routing;
  routing["rules"]          = QJsonArray();
  routing["domainStrategy"] = ConfigConstants::DOMAIN_STRATEGY;
  return routing;
}

QString ConfigBuilder::inboundTag(const QJsonObject& node, int port) {
  return makeTag(ConfigConstants::TAG_INBOUND_PREFIX, node, port);
}

QString ConfigBuilder::outboundTag(const QJsonObject& node, int port) {
  return makeTag(ConfigConstants::TAG_OUTBOUND_PREFIX, node, port);
}

QJsonObject ConfigBuilder::buildInbound(const QJsonObject& node, int port) {
  QJsonObject settings;
  settings["auth"]      = "noauth";
  settings["udp"]       = true;
  settings["userLevel"] = ConfigConstants::NODE_USER_LEVEL;
  QJsonObject sniffing;
  sniffing["enabled"]      = true;
  sniffing["destOverride"] = QJsonArray{"http", "tls"};
  QJsonObject inbound;
  inbound["port"]     = port;
  inbound["protocol"] = ConfigConstants::INBOUND_PROTOCOL;
  inbound["settings"] = settings;
  inbound["tag"]      = inboundTag(node, port);
  inbound["sniffing"] = sniffing;
  return inbound;
}

QJsonObject ConfigBuilder::buildOutbound(const QJsonObject& node, int port) {
  QJsonObject server;
  server["address"]  = node.value(ConfigConstants::KEY_SERVER).toString();
  server["port"]     = node.value(ConfigConstants::KEY_PORT).toVariant().toInt();
  server["method"]   = node.value(ConfigConstants::KEY_METHOD).toString();
  server["password"] = node.value(ConfigConstants::KEY_PASSWORD).toString();
  server["level"]    = ConfigConstants::NODE_USER_LEVEL;
  QJsonObject settings;
  settings["servers"] = QJsonArray{server};
  QJsonObject outbound;
  outbound["protocol"] = ConfigConstants::OUTBOUND_PROTOCOL;
  outbound["settings"] = settings;
  outbound["tag"]      = outboundTag(node, port);
  return outbound;
}

QJsonObject ConfigBuilder::buildRoutingRule(const QJsonObject& node, int port) {
  QJsonObject rule;
  rule["type"]        = ConfigConstants::RULE_TYPE_FIELD;
  rule["inboundTag"]  = QJsonArray{inboundTag(node, port)};
  rule["outboundTag"] = outboundTag(node, port);
  return rule;
}

QJsonObject ConfigBuilder::buildDirectOutbound() {
  QJsonObject direct;
  direct["protocol"] = ConfigConstants::DIRECT_PROTOCOL;
  direct["tag"]      = ConfigConstants::TAG_DIRECT;
  return direct;
}
