#include "pipeline.h"
#include "logging.h"
#include "ocrengine.h"
#include "outputnormalizer.h"
#include "textextractor.h"
#include "utils.h"
#include <functional>
#include <stdexcept>
#include <utility>

namespace comptaflow {

QString failureKindName(ExtractionFailure::Kind kind) {
    switch (kind) {
    case ExtractionFailure::Kind::Scanned: return "SCANNED";
    case ExtractionFailure::Kind::BankNotSupported: return "BANK_NOT_SUPPORTED";
    case ExtractionFailure::Kind::Unreadable: return "UNREADABLE";
    case ExtractionFailure::Kind::NoTransactionsFound: return "NO_TRANSACTIONS_FOUND";
    case ExtractionFailure::Kind::ExtractionError: break;
    }
    return "EXTRACTION_ERROR";
}

namespace {

ExtractionResult failed(ExtractionFailure::Kind kind, const QString &message, ValidationResult validation) {
    qCWarning(lcPipeline).noquote() << failureKindName(kind) << "-" << message;
    ExtractionResult result;
    result.failure = ExtractionFailure{ kind, message, std::move(validation) };
    return result;
}

struct Tier {
    QString name;
    ExtractionMethod method;
    std::function<TierResult()> run;
};

} // namespace

Pipeline::Pipeline(const PipelineConfig &config,
                   std::shared_ptr<const BankRegistry> registry,
                   std::shared_ptr<TextExtractor> textExtractor,
                   std::shared_ptr<OcrEngine> ocrEngine,
                   std::shared_ptr<CompletionClient> llmClient)
    : config_(config),
      text_(std::move(textExtractor)),
      ocr_(std::move(ocrEngine)),
      scanDetector_(config),
      validator_(std::move(registry), config),
      layouts_(config),
      llm_(std::move(llmClient), config)
{
    if (!text_) {
        throw std::runtime_error("Pipeline needs a text extractor");
    }
}

ValidationResult Pipeline::validate(const QString &text) const {
    return validator_.validate(text);
}

int Pipeline::estimateTransactions(const QString &text, const QString &bank) const {
    const BankSignature *sig = validator_.registry().find(bank);
    if (!sig) return 0;
    return layouts_.parseText(sig->layoutKind, text).size();
}

ExtractionResult Pipeline::extract(const QByteArray &document) const {
    try {
        return run(document);
    } catch (const std::exception &ex) {
        qCCritical(lcPipeline) << "Unexpected extraction fault:" << ex.what();
        ValidationResult validation;
        validation.supportedBanks = validator_.registry().supportedBanks();
        validation.message = QString::fromUtf8(ex.what());
        return failed(ExtractionFailure::Kind::ExtractionError, validation.message, validation);
    }
}

ExtractionResult Pipeline::run(const QByteArray &document) const {
    // Native text
    QStringList pages;
    bool readable = true;
    try {
        pages = text_->extractPages(document);
    } catch (const std::exception &ex) {
        qCWarning(lcPipeline) << "Native text extraction failed:" << ex.what();
        readable = false;
    }
    QString text = TextExtractor::joinPages(pages);
    qCInfo(lcPipeline) << "Native text:" << text.trimmed().size() << "characters," << pages.size() << "page(s)";

    // Scan check; unreadable documents are not classified as scans.
    const bool scanned = readable && scanDetector_.isScanned(pages);

    // Optical recognition
    bool fromOcr = false;
    if (scanned || text.trimmed().size() < config_.nearEmptyThreshold) {
        if (ocr_ && config_.ocrEnabled) {
            try {
                QString ocrText = ocr_->recognize(document);
                if (ocrText.trimmed().size() > text.trimmed().size()) {
                    text = ocrText;
                    fromOcr = true;
                }
            } catch (const std::exception &ex) {
                qCWarning(lcPipeline) << "OCR produced nothing:" << ex.what();
            }
        } else {
            qCInfo(lcPipeline) << "OCR needed but disabled";
        }
    }

    const bool enoughText = text.trimmed().size() >= config_.unreadableThreshold;

    // Validation
    if (scanned && !(fromOcr && enoughText)) {
        ValidationResult validation = validator_.validate(text, true);
        return failed(ExtractionFailure::Kind::Scanned, validation.message, validation);
    }
    if (!enoughText) {
        ValidationResult validation;
        validation.errorKind = ValidationResult::ErrorKind::Unreadable;
        validation.message = "Not enough text could be read from the document.";
        validation.supportedBanks = validator_.registry().supportedBanks();
        return failed(ExtractionFailure::Kind::Unreadable, validation.message, validation);
    }

    ValidationResult validation = validator_.validate(text, false);
    if (!validation.compatible) {
        return failed(ExtractionFailure::Kind::BankNotSupported, validation.message, validation);
    }
    const BankSignature *bank = validator_.registry().find(*validation.bank);
    if (!bank) {
        throw std::runtime_error("Validated bank missing from registry");
    }

    // Parser tiers
    Tier layoutTier{ "layout", fromOcr ? ExtractionMethod::OcrRegex : ExtractionMethod::NativeRegex,
                     [&]() { return runLayoutTier(*bank, text); } };
    Tier llmTier{ "llm", ExtractionMethod::Llm,
                  [&]() { return llm_.extract(text, bank->name); } };
    const QVector<Tier> tiers = config_.tierOrder == TierOrder::LlmFirst
        ? QVector<Tier>{ llmTier, layoutTier }
        : QVector<Tier>{ layoutTier, llmTier };

    for (const Tier &tier : tiers) {
        qCInfo(lcPipeline).noquote() << "Trying tier" << tier.name;
        TierResult result = tier.run();

        switch (result.status) {
        case TierResult::Status::Empty:
            qCInfo(lcPipeline).noquote() << "Tier" << tier.name << "found nothing" << result.reason;
            continue;
        case TierResult::Status::Error:
            qCWarning(lcPipeline).noquote() << "Tier" << tier.name << "failed:" << result.reason;
            continue;
        case TierResult::Status::Success:
            break;
        }

        std::optional<StatementTable> table = normalizeTransactions(result.transactions);
        if (!table) {
            return failed(ExtractionFailure::Kind::NoTransactionsFound,
                          QString("No valid transaction dates in %1 tier output.").arg(tier.name), validation);
        }

        ExtractionOutcome outcome;
        outcome.transactions = table->rows();
        outcome.method = tier.method;
        outcome.bank = bank->name;
        qCInfo(lcPipeline).noquote() << outcome.transactions.size() << "transaction(s) via"
                                     << extractionMethodName(outcome.method) << "for" << bank->name;

        ExtractionResult success;
        success.outcome = std::move(outcome);
        return success;
    }

    return failed(ExtractionFailure::Kind::NoTransactionsFound,
                  "No transaction found with the available methods.", validation);
}

TierResult Pipeline::runLayoutTier(const BankSignature &bank, const QString &text) const {
    if (bank.layoutKind == LayoutKind::None) {
        return TierResult::empty(QString("(no structural parser for %1)").arg(bank.name));
    }
    try {
        return TierResult::success(layouts_.parseText(bank.layoutKind, text));
    } catch (const std::exception &ex) {
        return TierResult::error(QString::fromUtf8(ex.what()));
    }
}

DocumentReport Pipeline::inspect(const QByteArray &document) const {
    DocumentReport report;
    QStringList pages;
    try {
        pages = text_->extractPages(document);
        report.scanned = scanDetector_.isScanned(pages);
    } catch (const std::exception &ex) {
        qCWarning(lcPipeline) << "Native text extraction failed:" << ex.what();
    }

    const QString text = TextExtractor::joinPages(pages);
    report.pageCount = pages.size();
    report.textLength = text.size();
    report.keywordHits = validator_.keywordHits(text);
    report.firstLines = text.split('\n').mid(0, 50);
    report.validation = validator_.validate(text, report.scanned);
    return report;
}

} // namespace comptaflow
