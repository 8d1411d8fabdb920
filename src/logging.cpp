#include "logging.h"
#include <QString>

Q_LOGGING_CATEGORY(lcText, "comptaflow.text")
Q_LOGGING_CATEGORY(lcScan, "comptaflow.scan")
Q_LOGGING_CATEGORY(lcOcr, "comptaflow.ocr")
Q_LOGGING_CATEGORY(lcBank, "comptaflow.bank")
Q_LOGGING_CATEGORY(lcLayout, "comptaflow.layout")
Q_LOGGING_CATEGORY(lcLlm, "comptaflow.llm")
Q_LOGGING_CATEGORY(lcPipeline, "comptaflow.pipeline")

namespace comptaflow {

void applyLogLevel(LogLevel level) {
    QString rules;
    switch (level) {
    case LogLevel::Debug:
        rules = "comptaflow.*=true";
        break;
    case LogLevel::Info:
        rules = "comptaflow.*.debug=false\ncomptaflow.*.info=true";
        break;
    case LogLevel::Warning:
        rules = "comptaflow.*.debug=false\ncomptaflow.*.info=false";
        break;
    case LogLevel::Critical:
        rules = "comptaflow.*.debug=false\ncomptaflow.*.info=false\ncomptaflow.*.warning=false";
        break;
    }
    QLoggingCategory::setFilterRules(rules);
}

LogLevel logLevelFromString(const QString &name, LogLevel fallback) {
    const QString n = name.trimmed().toLower();
    if (n == "debug") return LogLevel::Debug;
    if (n == "info") return LogLevel::Info;
    if (n == "warning" || n == "warn") return LogLevel::Warning;
    if (n == "critical" || n == "error") return LogLevel::Critical;
    return fallback;
}

} // namespace comptaflow
