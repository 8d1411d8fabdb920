#include "layoutparsers.h"
#include "logging.h"
#include "utils.h"
#include <QRegularExpression>
#include <utility>

namespace comptaflow {

LayoutParser::LayoutParser(QStringList stopKeywords)
    : stopKeywords_(std::move(stopKeywords))
{
}

bool LayoutParser::isBoilerplate(const QString &line) const {
    for (const QString &kw : stopKeywords_) {
        if (line.contains(kw)) return true;
    }
    return false;
}

QString LayoutParser::formatDate(int day, int month, int year) {
    return QString("%1/%2/%3")
        .arg(day, 2, 10, QChar('0'))
        .arg(month, 2, 10, QChar('0'))
        .arg(year, 4, 10, QChar('0'));
}

bool LayoutParser::parseAmount(const QString &token, double &amount) {
    QString t = token.trimmed();
    t.replace(',', '.');
    bool ok = false;
    amount = t.toDouble(&ok);
    return ok;
}

double LayoutParser::debit(double amount) {
    return amount == 0.0 ? 0.0 : -qAbs(amount);
}

// -----------------------------------------------------------------------------

DotDateParser::DotDateParser(int year)
    : LayoutParser({ "TOTAL", "Date", "Montant", "Commerce", "Page" }),
      year_(year)
{
}

QVector<TransactionCandidate> DotDateParser::parse(const QStringList &lines) const {
    static const QRegularExpression dateRe("(?<!\\d)(\\d{1,2})\\.(\\d{2})(?!\\d)");
    static const QRegularExpression amountRe("(?<![\\d,.])-?\\d{1,5},\\d{2}(?!\\d)");

    QVector<TransactionCandidate> out;
    for (const QString &line : lines) {
        if (isBoilerplate(line)) continue;

        QRegularExpressionMatch dm = dateRe.match(line);
        if (!dm.hasMatch()) continue;
        QRegularExpressionMatch am = amountRe.match(line, dm.capturedEnd());
        if (!am.hasMatch()) continue;

        const QString label = line.mid(dm.capturedEnd(), am.capturedStart() - dm.capturedEnd()).trimmed();
        if (label.size() < kMinLabelLength) continue;

        double amount = 0.0;
        if (!parseAmount(am.captured(0), amount)) continue;

        out.push_back({ formatDate(dm.captured(1).toInt(), dm.captured(2).toInt(), year_),
                        label, debit(amount) });
    }
    qCInfo(lcLayout) << "dot-date parser:" << out.size() << "candidate(s) from" << lines.size() << "line(s)";
    return out;
}

// -----------------------------------------------------------------------------

CompactDateParser::CompactDateParser()
    : LayoutParser({ "DATE", "NOM", "MONTANT", "Page", "TOTAL" })
{
}

QVector<TransactionCandidate> CompactDateParser::parse(const QStringList &lines) const {
    static const QRegularExpression dateRe("^(\\d{1,2})(\\d{2})(\\d{2})(?=\\s)");
    static const QRegularExpression amountRe("(\\d+),(\\d{2})(?!\\d)");

    QVector<TransactionCandidate> out;
    for (const QString &line : lines) {
        if (isBoilerplate(line)) continue;

        QRegularExpressionMatch dm = dateRe.match(line);
        if (!dm.hasMatch()) continue;
        QRegularExpressionMatch am = amountRe.match(line, dm.capturedEnd());
        if (!am.hasMatch()) continue;

        const QString label = line.mid(dm.capturedEnd(), am.capturedStart() - dm.capturedEnd()).trimmed();
        if (label.size() < kMinLabelLength) continue;

        double amount = 0.0;
        if (!parseAmount(am.captured(0), amount)) continue;

        out.push_back({ formatDate(dm.captured(1).toInt(), dm.captured(2).toInt(), 2000 + dm.captured(3).toInt()),
                        label, debit(amount) });
    }
    qCInfo(lcLayout) << "compact-date parser:" << out.size() << "candidate(s) from" << lines.size() << "line(s)";
    return out;
}

// -----------------------------------------------------------------------------

namespace {

const char *const kCardSection = "PAIEMENTS PAR CARTE";
const char *const kSectionEnd = "TOTAUX";
const int kHeadingSearchLines = 30;

} // namespace

AnchorDateParser::AnchorDateParser(int defaultYear)
    : LayoutParser({ "SOUS TOTAL", "LIBELLE", "VALEUR", "DEBIT", "CREDIT",
                     "CARTE N°", "Page", "Crédit Lyonnais", "SIREN", "RCS", "ORIAS",
                     "Indicatif", "Compte" }),
      defaultYear_(defaultYear)
{
}

int AnchorDateParser::monthFromName(const QString &name) {
    static const QMap<QString, int> months = {
        { "JANVIER", 1 }, { "FÉVRIER", 2 }, { "FEVRIER", 2 }, { "MARS", 3 },
        { "AVRIL", 4 }, { "MAI", 5 }, { "JUIN", 6 }, { "JUILLET", 7 },
        { "AOÛT", 8 }, { "AOUT", 8 }, { "SEPTEMBRE", 9 }, { "OCTOBRE", 10 },
        { "NOVEMBRE", 11 }, { "DÉCEMBRE", 12 }, { "DECEMBRE", 12 }
    };
    return months.value(name.trimmed().toUpper(), 0);
}

int AnchorDateParser::transactionYear(int statementYear, int statementMonth, int transactionMonth) {
    if (statementMonth > 0 && statementMonth < transactionMonth) {
        return statementYear - 1;
    }
    return statementYear;
}

bool AnchorDateParser::statementPeriod(const QString &line, int &month, int &year) {
    static const QRegularExpression headingRe(
        "PAIEMENTS PAR CARTE\\s+(?:D(?:E\\s+|')\\s*)?(\\p{L}+)\\s+(\\d{4})",
        QRegularExpression::UseUnicodePropertiesOption);
    QRegularExpressionMatch hm = headingRe.match(line.toUpper());
    if (!hm.hasMatch()) return false;
    month = monthFromName(hm.captured(1));
    year = hm.captured(2).toInt();
    return true;
}

QVector<TransactionCandidate> AnchorDateParser::parse(const QStringList &lines) const {
    static const QRegularExpression anchorRe("\\bLE\\s+(\\d{1,2})/(\\d{1,2})(?!\\d)");
    static const QRegularExpression trailingAmountRe("(\\d+[,.]\\d{2})\\s*$");
    static const QRegularExpression leadingAmountRe("^(\\d+[,.]\\d{2})(?!\\d)");

    int year = 0;
    int month = 0;
    for (int i = 0; i < lines.size() && i < kHeadingSearchLines; ++i) {
        if (!lines[i].toUpper().contains(kCardSection)) continue;
        if (statementPeriod(lines[i], month, year)) {
            qCDebug(lcLayout) << "Statement period: month" << month << "year" << year;
            break;
        }
    }
    if (year == 0) {
        year = defaultYear_;
        qCWarning(lcLayout) << "Statement month/year not found, using" << year;
    }

    int start = -1;
    int end = lines.size();
    for (int i = 0; i < lines.size(); ++i) {
        const QString upper = lines[i].toUpper();
        if (upper.contains(kCardSection)) {
            start = i + 1;
        }
        if (start >= 0 && upper.contains(kSectionEnd)) {
            end = i;
            break;
        }
    }
    if (start < 0) {
        qCWarning(lcLayout) << "Card payment section not found";
        return {};
    }

    QVector<TransactionCandidate> out;
    for (int i = start; i < end; ++i) {
        const QString line = lines[i].trimmed();
        if (line.isEmpty()) continue;
        if (isBoilerplate(line)) {
            qCDebug(lcLayout) << "skip:" << line.left(50);
            continue;
        }

        QRegularExpressionMatch dm = anchorRe.match(line);
        if (!dm.hasMatch()) continue;

        const int day = dm.captured(1).toInt();
        const int txMonth = dm.captured(2).toInt();
        const QString date = formatDate(day, txMonth, transactionYear(year, month, txMonth));

        double amount = 0.0;
        QRegularExpressionMatch am = trailingAmountRe.match(line);
        if (am.hasMatch()) {
            const QString label = line.left(am.capturedStart()).trimmed();
            if (label.size() >= kMinLabelLength && parseAmount(am.captured(1), amount)) {
                out.push_back({ date, label, debit(amount) });
            }
            continue;
        }

        if (i + 1 >= end) continue;
        QRegularExpressionMatch nm = leadingAmountRe.match(lines[i + 1].trimmed());
        if (!nm.hasMatch()) {
            qCDebug(lcLayout) << "no amount after:" << line.left(50);
            continue;
        }
        if (line.size() >= kMinLabelLength && parseAmount(nm.captured(1), amount)) {
            out.push_back({ date, line, debit(amount) });
            ++i;
        }
    }
    qCInfo(lcLayout) << "anchor-date parser:" << out.size() << "candidate(s) in section of" << end - start << "line(s)";
    return out;
}

// -----------------------------------------------------------------------------

LayoutParserSet::LayoutParserSet(const PipelineConfig &config) {
    const int year = config.effectiveYear();
    parsers_.insert(LayoutKind::DotDate, std::make_shared<DotDateParser>(year));
    parsers_.insert(LayoutKind::CompactDate, std::make_shared<CompactDateParser>());
    parsers_.insert(LayoutKind::AnchorDate, std::make_shared<AnchorDateParser>(year));
}

QVector<TransactionCandidate> LayoutParserSet::parse(LayoutKind kind, const QStringList &lines) const {
    auto parser = parsers_.value(kind);
    if (!parser) {
        qCInfo(lcLayout) << "No structural parser for layout" << layoutKindName(kind);
        return {};
    }
    return parser->parse(lines);
}

QVector<TransactionCandidate> LayoutParserSet::parseText(LayoutKind kind, const QString &text) const {
    return parse(kind, nonEmptyLines(text));
}

} // namespace comptaflow
