#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcText)
Q_DECLARE_LOGGING_CATEGORY(lcScan)
Q_DECLARE_LOGGING_CATEGORY(lcOcr)
Q_DECLARE_LOGGING_CATEGORY(lcBank)
Q_DECLARE_LOGGING_CATEGORY(lcLayout)
Q_DECLARE_LOGGING_CATEGORY(lcLlm)
Q_DECLARE_LOGGING_CATEGORY(lcPipeline)

namespace comptaflow {

enum class LogLevel { Debug, Info, Warning, Critical };

// Applies one filter rule set to every comptaflow.* category.
void applyLogLevel(LogLevel level);

LogLevel logLevelFromString(const QString &name, LogLevel fallback = LogLevel::Info);

} // namespace comptaflow
