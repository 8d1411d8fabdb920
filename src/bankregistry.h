#pragma once
#include <QByteArray>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>
#include <memory>

namespace comptaflow {

// Structural convention of a bank's statement lines.
enum class LayoutKind {
    None,        // known bank, no structural parser
    DotDate,     // "DD.MM LABEL 12,50"
    CompactDate, // "DDMMYY LABEL 12,50"
    AnchorDate   // "... LE DD/MM ..." with the amount on this or the next line
};

QString layoutKindName(LayoutKind kind);
LayoutKind layoutKindFromString(const QString &name);

struct BankSignature {
    QString name;
    QString description;
    QStringList keywords;   // stored upper-case
    LayoutKind layoutKind = LayoutKind::None;
};

// Read-only list of bank signatures, in match priority order. Built once and
// shared between requests through std::shared_ptr<const BankRegistry>.
class BankRegistry {
public:
    explicit BankRegistry(QVector<BankSignature> signatures);

    static std::shared_ptr<const BankRegistry> builtin();

    // [{"name": "...", "description": "...", "keywords": [...], "layout": "dot-date"}, ...]
    // Throws std::runtime_error on malformed input.
    static std::shared_ptr<const BankRegistry> fromJson(const QByteArray &json);
    static std::shared_ptr<const BankRegistry> fromFile(const QString &path);

    const QVector<BankSignature> &signatures() const { return signatures_; }
    const BankSignature *find(const QString &name) const;

    // Code -> description.
    QMap<QString, QString> supportedBanks() const;

private:
    QVector<BankSignature> signatures_;
};

} // namespace comptaflow
