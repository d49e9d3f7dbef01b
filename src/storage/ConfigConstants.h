#ifndef CONFIGCONSTANTS_H
#define CONFIGCONSTANTS_H

#include <QString>
#include <QStringList>
namespace ConfigConstants {

// ==================== Outbound tags ====================
// Catch-all outbound appended after every generated node (keep stable)
const QString TAG_DIRECT          = "direct";
const QString TAG_INBOUND_PREFIX  = "in";
const QString TAG_OUTBOUND_PREFIX = "out";

// ==================== Region buckets ====================
const QString REGION_OTHER = "Other";

// ==================== Input record keys ====================
const QString KEY_REMARKS  = "remarks";
const QString KEY_SERVER   = "server";
const QString KEY_PORT     = "server_port";
const QString KEY_METHOD   = "method";
const QString KEY_PASSWORD = "password";

// ==================== Info nodes ====================
// Subscription entries that announce provider status instead of a server:
// latest URL, remaining traffic, expiry date.
inline QStringList defaultInfoMarkers() {
  return {QStringLiteral("最新网址"), QStringLiteral("剩余流量"),
          QStringLiteral("过期时间")};
}

// ==================== Generated entries ====================
const QString DOMAIN_STRATEGY   = "IPIfNonMatch";
const QString INBOUND_PROTOCOL  = "socks";
const QString OUTBOUND_PROTOCOL = "shadowsocks";
const QString DIRECT_PROTOCOL   = "freedom";
const QString RULE_TYPE_FIELD   = "field";
const int     NODE_USER_LEVEL   = 1;

// ==================== Default configuration ====================
const int     DEFAULT_START_PORT      = 10001;
const int     MIN_PORT                = 1;
const int     MAX_PORT                = 65535;
const QString DEFAULT_INPUT_FILE      = "shadowsocks.json";
const QString DEFAULT_OUTPUT_FILE     = "config.json";
const QString DEFAULT_COMPOSE_FILE    = "docker-compose.yaml";
const QString DEFAULT_COMPOSE_SERVICE = "v2ray";

}  // namespace ConfigConstants
#endif  // CONFIGCONSTANTS_H
