#include "Logger.h"
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>

Logger& Logger::instance() {
  static Logger instance;
  return instance;
}

Logger::Logger() : m_initialized(false), m_verbose(false) {}

Logger::~Logger() {
  close();
}

bool Logger::init(const QString& logFilePath) {
  if (m_initialized) {
    return true;
  }
  if (logFilePath.isEmpty()) {
    return true;
  }
  // Ensure log directory exists.
  QDir dir(QFileInfo(logFilePath).absolutePath());
  if (!dir.exists()) {
    dir.mkpath(".");
  }
  m_logFile.setFileName(logFilePath);
  if (!m_logFile.open(QIODevice::Append | QIODevice::Text)) {
    warn(QString("Failed to open log file %1: %2")
             .arg(logFilePath, m_logFile.errorString()));
    return false;
  }
  m_initialized = true;
  debug(QString("Logging to %1").arg(logFilePath));
  return true;
}

void Logger::close() {
  QMutexLocker locker(&m_mutex);
  if (m_logFile.isOpen()) {
    m_logFile.close();
  }
  m_initialized = false;
}

void Logger::setVerbose(bool verbose) {
  m_verbose = verbose;
}

bool Logger::isVerbose() const {
  return m_verbose;
}

void Logger::log(const QString& level, const QString& message) {
  QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
  QString logLine   = QString("[%1] [%2] %3").arg(timestamp, level, message);
  // Output to console.
  qDebug().noquote() << logLine;
  // Output to file.
  QMutexLocker locker(&m_mutex);
  if (m_initialized) {
    QTextStream stream(&m_logFile);
    stream << logLine << "\n";
    stream.flush();
  }
}

void Logger::debug(const QString& message) {
  if (!instance().m_verbose) {
    return;
  }
  instance().log("DEBUG", message);
}

void Logger::info(const QString& message) {
  instance().log("INFO", message);
}

void Logger::warn(const QString& message) {
  instance().log("WARN", message);
}

void Logger::error(const QString& message) {
  instance().log("ERROR", message);
}
