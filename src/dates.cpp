#include "dates.h"
#include <QRegularExpression>

namespace comptaflow {

namespace {

std::optional<QString> checked(const QString &day, const QString &month, const QString &year) {
    QDate d(year.toInt(), month.toInt(), day.toInt());
    if (!d.isValid()) return std::nullopt;
    return QString("%1/%2/%3").arg(day, month, year);
}

} // namespace

std::optional<QString> normalizeDate(const QString &value) {
    static const QRegularExpression slashRe("^(\\d{2})/(\\d{2})/(\\d{4})$");
    static const QRegularExpression compactRe("^(\\d{2})(\\d{2})(\\d{4})$");
    static const QRegularExpression dashRe("^(\\d{2})-(\\d{2})-(\\d{4})$");

    const QString v = value.trimmed();
    for (const QRegularExpression *re : { &slashRe, &compactRe, &dashRe }) {
        QRegularExpressionMatch m = re->match(v);
        if (m.hasMatch()) {
            return checked(m.captured(1), m.captured(2), m.captured(3));
        }
    }
    return std::nullopt;
}

std::optional<QDate> parseStatementDate(const QString &value) {
    static const QRegularExpression re("^(\\d{1,2})/(\\d{1,2})/(\\d{4})$");
    QRegularExpressionMatch m = re.match(value.trimmed());
    if (!m.hasMatch()) return std::nullopt;
    QDate d(m.captured(3).toInt(), m.captured(2).toInt(), m.captured(1).toInt());
    if (!d.isValid()) return std::nullopt;
    return d;
}

QString formatStatementDate(const QDate &date) {
    return date.toString("dd/MM/yyyy");
}

} // namespace comptaflow
