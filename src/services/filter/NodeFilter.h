#ifndef NODEFILTER_H
#define NODEFILTER_H

#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QStringList>

namespace NodeFilter {
struct Stats {
  int kept           = 0;
  int missingRemarks = 0;
  int infoNodes      = 0;
  int incomplete     = 0;
};

bool isInfoRemarks(const QString& remarks, const QStringList& markers);
// server, server_port, method and password present and usable.
bool hasServerFields(const QJsonObject& node);
// Keeps real server nodes in input order.
QList<QJsonObject> filterInfoNodes(const QJsonArray&  nodes,
                                   const QStringList& markers,
                                   Stats*             stats = nullptr);
}  // namespace NodeFilter

#endif  // NODEFILTER_H
