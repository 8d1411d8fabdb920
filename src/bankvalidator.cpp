#include "bankvalidator.h"
#include "logging.h"
#include <QStringList>
#include <stdexcept>
#include <utility>

namespace comptaflow {

QString errorKindName(ValidationResult::ErrorKind kind) {
    switch (kind) {
    case ValidationResult::ErrorKind::None: return "NONE";
    case ValidationResult::ErrorKind::Scanned: return "SCANNED";
    case ValidationResult::ErrorKind::BankNotSupported: return "BANK_NOT_SUPPORTED";
    case ValidationResult::ErrorKind::Unreadable: return "UNREADABLE";
    case ValidationResult::ErrorKind::Unknown: break;
    }
    return "UNKNOWN";
}

BankValidator::BankValidator(std::shared_ptr<const BankRegistry> registry, const PipelineConfig &config)
    : registry_(std::move(registry)),
      scanDetector_(config)
{
    if (!registry_) {
        throw std::runtime_error("BankValidator needs a bank registry");
    }
}

ValidationResult BankValidator::validate(const QString &text) const {
    return validate(text, scanDetector_.isScanned(text));
}

ValidationResult BankValidator::validate(const QString &text, bool scanned) const {
    ValidationResult result;
    result.supportedBanks = registry_->supportedBanks();

    if (scanned) {
        result.errorKind = ValidationResult::ErrorKind::Scanned;
        result.message = "The document is a scanned image; no text could be read from it.";
        qCInfo(lcBank) << "Validation: scanned document";
        return result;
    }

    const BankSignature *sig = detect(text);
    if (!sig) {
        result.errorKind = ValidationResult::ErrorKind::BankNotSupported;
        result.message = QString("Bank not recognized. Supported banks: %1.")
            .arg(QStringList(result.supportedBanks.values()).join(", "));
        qCInfo(lcBank) << "Validation: no bank signature matched";
        return result;
    }

    result.compatible = true;
    result.bank = sig->name;
    result.errorKind = ValidationResult::ErrorKind::None;
    result.message = QString("%1 statement detected.").arg(sig->description);
    qCInfo(lcBank) << "Validation: bank" << sig->name;
    return result;
}

const BankSignature *BankValidator::detect(const QString &text) const {
    const QString upper = text.toUpper();
    for (const BankSignature &sig : registry_->signatures()) {
        for (const QString &kw : sig.keywords) {
            if (upper.contains(kw)) {
                qCDebug(lcBank) << "Keyword" << kw << "matched bank" << sig.name;
                return &sig;
            }
        }
    }
    return nullptr;
}

QMap<QString, QStringList> BankValidator::keywordHits(const QString &text) const {
    const QString upper = text.toUpper();
    QMap<QString, QStringList> hits;
    for (const BankSignature &sig : registry_->signatures()) {
        QStringList found;
        for (const QString &kw : sig.keywords) {
            if (upper.contains(kw)) found << kw;
        }
        if (!found.isEmpty()) hits[sig.name] << found;
    }
    return hits;
}

} // namespace comptaflow
