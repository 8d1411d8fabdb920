#pragma once
#include <QDate>
#include <QString>
#include <optional>

namespace comptaflow {

// Accepts exactly "DD/MM/YYYY", "DDMMYYYY" and "DD-MM-YYYY"; returns
// "DD/MM/YYYY" for a real calendar date, std::nullopt otherwise.
std::optional<QString> normalizeDate(const QString &value);

// Lenient day-first parse used on parser output ("5/3/2025" is accepted).
std::optional<QDate> parseStatementDate(const QString &value);

QString formatStatementDate(const QDate &date);

} // namespace comptaflow
