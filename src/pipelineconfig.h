#pragma once
#include <QString>
#include "logging.h"

namespace comptaflow {

enum class TierOrder { LayoutFirst, LlmFirst };

struct PipelineConfig {
    LogLevel logLevel = LogLevel::Info;
    bool debug = false;

    // Scan detection
    int scanMinChars = 200;
    int scanMinWords = 50;
    int scanMinKeywords = 2;
    int scanPages = 3;

    // OCR
    bool ocrEnabled = true;
    int nearEmptyThreshold = 100;
    int unreadableThreshold = 50;
    int dpi = 300;
    QString ocrLanguage = "fra";
    QString tesseractPath;
    QString tessdataDir;

    // Language model
    int llmCharBudget = 8000;
    QString llmEndpoint = "https://api.mistral.ai/v1/chat/completions";
    QString llmModel = "mistral-small-latest";
    QString llmApiKey;
    double llmTemperature = 0.1;
    int llmMaxTokens = 4000;

    TierOrder tierOrder = TierOrder::LayoutFirst;
    int defaultYear = 0;   // 0 means the current year
    QString bankRegistryPath;

    int effectiveYear() const;
};

// Reads an INI file ([logging], [scan], [ocr], [llm], [pipeline] groups) and
// applies MISTRAL_API_KEY / COMPTAFLOW_* environment overrides.
// A missing file leaves the defaults in place; a malformed one throws.
PipelineConfig loadConfig(const QString &iniPath);

void applyEnvironment(PipelineConfig &config);

TierOrder tierOrderFromString(const QString &name);
QString tierOrderName(TierOrder order);

} // namespace comptaflow
