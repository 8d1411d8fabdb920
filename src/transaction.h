#pragma once
#include <QDate>
#include <QString>
#include <QVector>
#include <optional>
#include <utility>

namespace comptaflow {

// Raw row produced by a parser tier. `date` is "DD/MM/YYYY" but is not yet
// checked against the calendar.
struct TransactionCandidate {
    QString date;
    QString label;
    double amount = 0.0;
};

// Negative amount = debit, positive = credit.
struct Transaction {
    QDate occurredOn;
    QString label;
    double amount = 0.0;
};

enum class ExtractionMethod { NativeRegex, OcrRegex, Llm };

QString extractionMethodName(ExtractionMethod method);

struct ExtractionOutcome {
    QVector<Transaction> transactions;
    ExtractionMethod method = ExtractionMethod::NativeRegex;
    std::optional<QString> bank;
};

// Tagged result of one extraction tier.
struct TierResult {
    enum class Status { Empty, Error, Success };

    Status status = Status::Empty;
    QString reason;
    QVector<TransactionCandidate> transactions;

    static TierResult empty(const QString &reason = QString()) {
        return TierResult{Status::Empty, reason, {}};
    }
    static TierResult error(const QString &reason) {
        return TierResult{Status::Error, reason, {}};
    }
    // An empty list is reported as Empty, never as Success.
    static TierResult success(QVector<TransactionCandidate> rows) {
        if (rows.isEmpty()) return empty();
        return TierResult{Status::Success, QString(), std::move(rows)};
    }
};

} // namespace comptaflow
