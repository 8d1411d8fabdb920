#pragma once
#include <QByteArray>
#include <QMap>
#include <QString>
#include <QStringList>
#include <memory>
#include <optional>
#include "bankvalidator.h"
#include "layoutparsers.h"
#include "llmextractor.h"
#include "pipelineconfig.h"
#include "scandetector.h"
#include "transaction.h"

namespace comptaflow {

class OcrEngine;
class TextExtractor;

struct ExtractionFailure {
    enum class Kind { Scanned, BankNotSupported, Unreadable, NoTransactionsFound, ExtractionError };

    Kind kind = Kind::ExtractionError;
    QString message;
    ValidationResult validation;
};

QString failureKindName(ExtractionFailure::Kind kind);

// Either an outcome or a failure, never both.
struct ExtractionResult {
    std::optional<ExtractionOutcome> outcome;
    std::optional<ExtractionFailure> failure;

    bool succeeded() const { return outcome.has_value(); }
};

// What the pipeline sees in a document, for troubleshooting.
struct DocumentReport {
    int pageCount = 0;
    int textLength = 0;
    bool scanned = false;
    QMap<QString, QStringList> keywordHits;
    QStringList firstLines;
    ValidationResult validation;
};

// Sequences text extraction, scan detection, OCR, bank validation and the
// two parser tiers for one document at a time. Holds no per-document state;
// one instance may serve concurrent callers if its backends allow it.
class Pipeline {
public:
    Pipeline(const PipelineConfig &config,
             std::shared_ptr<const BankRegistry> registry,
             std::shared_ptr<TextExtractor> textExtractor,
             std::shared_ptr<OcrEngine> ocrEngine,
             std::shared_ptr<CompletionClient> llmClient);

    ValidationResult validate(const QString &text) const;

    // Never throws.
    ExtractionResult extract(const QByteArray &document) const;

    // Candidate count of the bank's structural parser; 0 for unknown banks.
    int estimateTransactions(const QString &text, const QString &bank) const;

    DocumentReport inspect(const QByteArray &document) const;

    const BankValidator &validator() const { return validator_; }

private:
    ExtractionResult run(const QByteArray &document) const;
    TierResult runLayoutTier(const BankSignature &bank, const QString &text) const;

    PipelineConfig config_;
    std::shared_ptr<TextExtractor> text_;
    std::shared_ptr<OcrEngine> ocr_;
    ScanDetector scanDetector_;
    BankValidator validator_;
    LayoutParserSet layouts_;
    LlmExtractor llm_;
};

} // namespace comptaflow
