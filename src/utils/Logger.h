#ifndef LOGGER_H
#define LOGGER_H
#include <QFile>
#include <QMutex>
#include <QString>
class Logger {
 public:
  static Logger& instance();
  // Empty path keeps console-only output.
  bool           init(const QString& logFilePath = QString());
  void           close();
  void           setVerbose(bool verbose);
  bool           isVerbose() const;
  static void    debug(const QString& message);
  static void    info(const QString& message);
  static void    warn(const QString& message);
  static void    error(const QString& message);

 private:
  Logger();
  ~Logger();
  void   log(const QString& level, const QString& message);
  QFile  m_logFile;
  QMutex m_mutex;
  bool   m_initialized;
  bool   m_verbose;
};
#endif  // LOGGER_H
