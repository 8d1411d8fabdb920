#pragma once
#include <QMap>
#include <QString>
#include <QStringList>
#include <memory>
#include <optional>
#include "bankregistry.h"
#include "scandetector.h"

namespace comptaflow {

struct ValidationResult {
    enum class ErrorKind { None, Scanned, BankNotSupported, Unreadable, Unknown };

    bool compatible = false;
    std::optional<QString> bank;
    ErrorKind errorKind = ErrorKind::Unknown;
    QString message;
    QMap<QString, QString> supportedBanks;
};

QString errorKindName(ValidationResult::ErrorKind kind);

class BankValidator {
public:
    BankValidator(std::shared_ptr<const BankRegistry> registry, const PipelineConfig &config);

    // Runs the scan heuristics over `text` itself.
    ValidationResult validate(const QString &text) const;
    // Uses the caller's scanned verdict instead.
    ValidationResult validate(const QString &text, bool scanned) const;

    // First signature, in registry order, with at least one keyword in `text`.
    const BankSignature *detect(const QString &text) const;

    // Bank name -> keywords found in `text`; banks without hits are omitted.
    QMap<QString, QStringList> keywordHits(const QString &text) const;

    const BankRegistry &registry() const { return *registry_; }

private:
    std::shared_ptr<const BankRegistry> registry_;
    ScanDetector scanDetector_;
};

} // namespace comptaflow
