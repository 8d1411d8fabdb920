#include "pipelineconfig.h"
#include <QDate>
#include <QFileInfo>
#include <QSettings>
#include <QStringList>
#include <stdexcept>

namespace comptaflow {

int PipelineConfig::effectiveYear() const {
    return defaultYear > 0 ? defaultYear : QDate::currentDate().year();
}

TierOrder tierOrderFromString(const QString &name) {
    const QString n = name.trimmed().toLower();
    if (n == "layout-first" || n == "layout" || n == "regex") return TierOrder::LayoutFirst;
    if (n == "llm-first" || n == "llm") return TierOrder::LlmFirst;
    throw std::runtime_error(QString("Unknown tier order: %1").arg(name).toStdString());
}

QString tierOrderName(TierOrder order) {
    return order == TierOrder::LlmFirst ? "llm-first" : "layout-first";
}

PipelineConfig loadConfig(const QString &iniPath) {
    PipelineConfig config;

    if (!iniPath.isEmpty() && QFileInfo::exists(iniPath)) {
        QSettings s(iniPath, QSettings::IniFormat);
        const QStringList keys = s.allKeys();
        if (s.status() != QSettings::NoError) {
            throw std::runtime_error(QString("Malformed configuration file: %1").arg(iniPath).toStdString());
        }
        if (keys.isEmpty()) {
            qCWarning(lcPipeline) << "Configuration file has no keys:" << iniPath;
        }

        config.logLevel = logLevelFromString(s.value("logging/level").toString(), config.logLevel);
        config.debug = s.value("logging/debug", config.debug).toBool();

        config.scanMinChars = s.value("scan/min_chars", config.scanMinChars).toInt();
        config.scanMinWords = s.value("scan/min_words", config.scanMinWords).toInt();
        config.scanMinKeywords = s.value("scan/min_keywords", config.scanMinKeywords).toInt();
        config.scanPages = s.value("scan/pages", config.scanPages).toInt();

        config.ocrEnabled = s.value("ocr/enabled", config.ocrEnabled).toBool();
        config.nearEmptyThreshold = s.value("ocr/near_empty_threshold", config.nearEmptyThreshold).toInt();
        config.unreadableThreshold = s.value("ocr/unreadable_threshold", config.unreadableThreshold).toInt();
        config.dpi = s.value("ocr/dpi", config.dpi).toInt();
        config.ocrLanguage = s.value("ocr/language", config.ocrLanguage).toString();
        config.tesseractPath = s.value("ocr/tesseract_path", config.tesseractPath).toString();
        config.tessdataDir = s.value("ocr/tessdata_dir", config.tessdataDir).toString();

        config.llmCharBudget = s.value("llm/char_budget", config.llmCharBudget).toInt();
        config.llmEndpoint = s.value("llm/endpoint", config.llmEndpoint).toString();
        config.llmModel = s.value("llm/model", config.llmModel).toString();
        config.llmApiKey = s.value("llm/api_key", config.llmApiKey).toString();
        config.llmTemperature = s.value("llm/temperature", config.llmTemperature).toDouble();
        config.llmMaxTokens = s.value("llm/max_tokens", config.llmMaxTokens).toInt();

        if (s.contains("pipeline/tier_order")) {
            config.tierOrder = tierOrderFromString(s.value("pipeline/tier_order").toString());
        }
        config.defaultYear = s.value("pipeline/default_year", config.defaultYear).toInt();
        config.bankRegistryPath = s.value("pipeline/bank_registry", config.bankRegistryPath).toString();
    }

    applyEnvironment(config);

    if (config.dpi < 72) {
        throw std::runtime_error("ocr/dpi must be at least 72");
    }
    if (config.llmCharBudget <= 0) {
        throw std::runtime_error("llm/char_budget must be positive");
    }
    return config;
}

void applyEnvironment(PipelineConfig &config) {
    if (qEnvironmentVariableIsSet("MISTRAL_API_KEY")) {
        config.llmApiKey = qEnvironmentVariable("MISTRAL_API_KEY");
    }
    if (qEnvironmentVariableIsSet("COMPTAFLOW_DEBUG")) {
        const QString v = qEnvironmentVariable("COMPTAFLOW_DEBUG").toLower();
        config.debug = (v == "1" || v == "true" || v == "yes");
        if (config.debug) config.logLevel = LogLevel::Debug;
    }
    if (qEnvironmentVariableIsSet("COMPTAFLOW_TESSDATA")) {
        config.tessdataDir = qEnvironmentVariable("COMPTAFLOW_TESSDATA");
    }
    if (qEnvironmentVariableIsSet("COMPTAFLOW_TIER_ORDER")) {
        config.tierOrder = tierOrderFromString(qEnvironmentVariable("COMPTAFLOW_TIER_ORDER"));
    }
}

} // namespace comptaflow
