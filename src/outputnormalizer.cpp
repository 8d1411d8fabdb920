#include "outputnormalizer.h"
#include "dates.h"
#include "logging.h"
#include <QFile>
#include <QStringList>
#include <QTextStream>
#include <stdexcept>
#include <utility>

namespace comptaflow {

namespace {

QString csvField(const QString &value) {
    if (value.contains(',') || value.contains('"') || value.contains('\n')) {
        QString escaped = value;
        escaped.replace("\"", "\"\"");
        return "\"" + escaped + "\"";
    }
    return value;
}

QStringList cells(const Transaction &t) {
    return { formatStatementDate(t.occurredOn), t.label, formatAmount(t.amount) };
}

} // namespace

QString formatAmount(double amount) {
    return QString::number(amount, 'f', 2);
}

StatementTable::StatementTable(QVector<Transaction> rows)
    : rows_(std::move(rows))
{
}

QStringList StatementTable::headers() {
    return { "Date", "Libellé", "Montant" };
}

QString StatementTable::toCsv() const {
    QString out;
    QTextStream ts(&out);
    ts << headers().join(',') << '\n';
    for (const Transaction &t : rows_) {
        QStringList fields;
        for (const QString &c : cells(t)) fields << csvField(c);
        ts << fields.join(',') << '\n';
    }
    ts.flush();
    return out;
}

QString StatementTable::toText() const {
    auto line = [](const QStringList &row) {
        QString s;
        s += row[0].leftJustified(kColumnWidths[0]);
        s += row[1].leftJustified(kColumnWidths[1]);
        s += row[2].rightJustified(kColumnWidths[2]);
        return s;
    };

    QStringList lines;
    lines << line(headers());
    for (const Transaction &t : rows_) {
        lines << line(cells(t));
    }
    return lines.join('\n') + '\n';
}

void StatementTable::writeCsv(const QString &path) const {
    QFile outf(path);
    if (!outf.open(QIODevice::WriteOnly | QIODevice::Text)) {
        throw std::runtime_error(QString("Failed to open output file for writing: %1").arg(path).toStdString());
    }
    const QByteArray data = toCsv().toUtf8();
    if (outf.write(data) != data.size()) {
        throw std::runtime_error(QString("Failed to write output file: %1").arg(path).toStdString());
    }
    outf.close();
}

std::optional<StatementTable> normalizeTransactions(const QVector<TransactionCandidate> &candidates) {
    QVector<Transaction> rows;
    int dropped = 0;
    for (const TransactionCandidate &c : candidates) {
        const std::optional<QDate> date = parseStatementDate(c.date);
        const QString label = c.label.trimmed();
        if (!date || label.isEmpty()) {
            ++dropped;
            qCDebug(lcPipeline) << "Dropping row with date" << c.date << "label" << c.label;
            continue;
        }
        rows.push_back({ *date, label, c.amount });
    }

    if (dropped > 0) {
        qCInfo(lcPipeline) << dropped << "row(s) dropped during normalization";
    }
    if (rows.isEmpty()) {
        return std::nullopt;
    }
    return StatementTable(std::move(rows));
}

} // namespace comptaflow
