#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <array>
#include <optional>
#include "transaction.h"

namespace comptaflow {

// Date / Libellé / Montant rows ready for export.
class StatementTable {
public:
    static constexpr std::array<int, 3> kColumnWidths = { 12, 50, 15 };

    explicit StatementTable(QVector<Transaction> rows);

    const QVector<Transaction> &rows() const { return rows_; }
    int rowCount() const { return rows_.size(); }

    static QStringList headers();

    QString toCsv() const;
    // Columns padded to kColumnWidths; longer cells are not cut.
    QString toText() const;

    // Throws std::runtime_error when the file cannot be written.
    void writeCsv(const QString &path) const;

private:
    QVector<Transaction> rows_;
};

// Drops rows with an unparseable date or an empty label. Returns std::nullopt
// when nothing survives.
std::optional<StatementTable> normalizeTransactions(const QVector<TransactionCandidate> &candidates);

QString formatAmount(double amount);

} // namespace comptaflow
