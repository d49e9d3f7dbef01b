#ifndef CONFIGMUTATOR_H
#define CONFIGMUTATOR_H

#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>
class ConfigMutator {
 public:
  // Repairs missing sections and drops catch-all outbounds left by earlier runs.
  static void       normalize(QJsonObject& config);
  static QList<int> inboundPorts(const QJsonObject& config);
  // Moves the start port past the highest port already in use.
  static int        adjustStartPort(const QJsonObject& config, int startPort);
  // Appends one triple per node on consecutive ports and returns those ports.
  static QList<int> injectNodes(QJsonObject& config, const QList<QJsonObject>& nodes, int startPort);
  static void       appendDirectOutbound(QJsonObject& config);
};
#endif  // CONFIGMUTATOR_H
