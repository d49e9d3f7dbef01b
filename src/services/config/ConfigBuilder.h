#ifndef CONFIGBUILDER_H
#define CONFIGBUILDER_H

#include <QJsonArray>
#include <QJsonObject>
#include <QString>

/**
 * @brief Builds the V2Ray documents and entries generated for each node.
 *
 * Every selected node becomes an inbound/outbound/rule triple tagged
 * "in-{port}-{remarks}" and "out-{port}-{remarks}".
 */
class ConfigBuilder {
 public:
  static QJsonObject buildBaseConfig();
  static QJsonObject buildRoutingConfig();
  static QJsonObject buildInbound(const QJsonObject& node, int port);
  static QJsonObject buildOutbound(const QJsonObject& node, int port);
  static QJsonObject buildRoutingRule(const QJsonObject& node, int port);
  static QJsonObject buildDirectOutbound();
  static QString     inboundTag(const QJsonObject& node, int port);
  static QString     outboundTag(const QJsonObject& node, int port);
};

#endif  // CONFIGBUILDER_H
