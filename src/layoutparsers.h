#pragma once
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>
#include <memory>
#include "bankregistry.h"
#include "pipelineconfig.h"
#include "transaction.h"

namespace comptaflow {

// Turns the trimmed, non-empty lines of a statement into candidates.
// Lines that do not fit the layout are skipped, never guessed.
class LayoutParser {
public:
    explicit LayoutParser(QStringList stopKeywords);
    virtual ~LayoutParser() = default;

    virtual LayoutKind kind() const = 0;
    virtual QVector<TransactionCandidate> parse(const QStringList &lines) const = 0;

    static constexpr int kMinLabelLength = 3;

protected:
    // Headers, footers and totals. Matching is case-sensitive.
    bool isBoilerplate(const QString &line) const;

    static QString formatDate(int day, int month, int year);
    // "12,50" or "12.50" -> 12.5
    static bool parseAmount(const QString &token, double &amount);
    // Negative magnitude; zero stays +0.0.
    static double debit(double amount);

private:
    QStringList stopKeywords_;
};

// "15.03 BOULANGERIE PARIS 12,50"; the year is not printed.
class DotDateParser : public LayoutParser {
public:
    explicit DotDateParser(int year);
    LayoutKind kind() const override { return LayoutKind::DotDate; }
    QVector<TransactionCandidate> parse(const QStringList &lines) const override;

private:
    int year_;
};

// "150325 CARREFOUR MARKET LYON 45,20"
class CompactDateParser : public LayoutParser {
public:
    CompactDateParser();
    LayoutKind kind() const override { return LayoutKind::CompactDate; }
    QVector<TransactionCandidate> parse(const QStringList &lines) const override;
};

// Card payment section of a monthly statement:
//   "PAIEMENTS PAR CARTE DE JANVIER 2025" ... "CB SNCF LE 28/12 54,00" ... "TOTAUX"
// The amount is either at the end of the anchor line or opens the next line.
class AnchorDateParser : public LayoutParser {
public:
    explicit AnchorDateParser(int defaultYear);
    LayoutKind kind() const override { return LayoutKind::AnchorDate; }
    QVector<TransactionCandidate> parse(const QStringList &lines) const override;

    // Month lookup for French month names, accented or not; 0 if unknown.
    static int monthFromName(const QString &name);
    // A transaction dated after the statement month belongs to the previous year.
    static int transactionYear(int statementYear, int statementMonth, int transactionMonth);
    // Reads "PAIEMENTS PAR CARTE [DE|D'] <MOIS> <YYYY>". month is 0 for an
    // unknown month name. False when the line is not a section heading.
    static bool statementPeriod(const QString &line, int &month, int &year);

private:
    int defaultYear_;
};

class LayoutParserSet {
public:
    explicit LayoutParserSet(const PipelineConfig &config);

    // Empty for LayoutKind::None and for kinds without a parser.
    QVector<TransactionCandidate> parse(LayoutKind kind, const QStringList &lines) const;
    QVector<TransactionCandidate> parseText(LayoutKind kind, const QString &text) const;

private:
    QMap<LayoutKind, std::shared_ptr<const LayoutParser>> parsers_;
};

} // namespace comptaflow
