#include "bankregistry.h"
#include "logging.h"
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <stdexcept>
#include <utility>

namespace comptaflow {

QString layoutKindName(LayoutKind kind) {
    switch (kind) {
    case LayoutKind::DotDate: return "dot-date";
    case LayoutKind::CompactDate: return "compact-date";
    case LayoutKind::AnchorDate: return "anchor-date";
    case LayoutKind::None: break;
    }
    return "none";
}

LayoutKind layoutKindFromString(const QString &name) {
    const QString n = name.trimmed().toLower();
    if (n == "dot-date") return LayoutKind::DotDate;
    if (n == "compact-date") return LayoutKind::CompactDate;
    if (n == "anchor-date") return LayoutKind::AnchorDate;
    if (n.isEmpty() || n == "none") return LayoutKind::None;
    throw std::runtime_error(QString("Unknown layout kind: %1").arg(name).toStdString());
}

BankRegistry::BankRegistry(QVector<BankSignature> signatures)
    : signatures_(std::move(signatures))
{
    for (BankSignature &sig : signatures_) {
        for (QString &kw : sig.keywords) {
            kw = kw.trimmed().toUpper();
        }
        sig.keywords.removeAll(QString());
    }
}

std::shared_ptr<const BankRegistry> BankRegistry::builtin() {
    static const std::shared_ptr<const BankRegistry> registry = std::make_shared<const BankRegistry>(
        QVector<BankSignature>{
            { "CA", "Crédit Agricole",
              { "CREDIT AGRICOLE", "CRÉDIT AGRICOLE" }, LayoutKind::DotDate },
            { "BP", "Banque Populaire",
              { "BANQUE POPULAIRE" }, LayoutKind::CompactDate },
            { "LCL", "LCL - Crédit Lyonnais",
              { "CREDIT LYONNAIS", "CRÉDIT LYONNAIS", "LCL" }, LayoutKind::AnchorDate },
        });
    return registry;
}

std::shared_ptr<const BankRegistry> BankRegistry::fromJson(const QByteArray &json) {
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError) {
        throw std::runtime_error(QString("Invalid bank registry JSON: %1").arg(err.errorString()).toStdString());
    }
    if (!doc.isArray()) {
        throw std::runtime_error("Bank registry JSON must be an array.");
    }

    QVector<BankSignature> signatures;
    const QJsonArray entries = doc.array();
    for (const QJsonValue &value : entries) {
        const QJsonObject obj = value.toObject();
        BankSignature sig;
        sig.name = obj.value("name").toString().trimmed();
        sig.description = obj.value("description").toString(sig.name);
        sig.layoutKind = layoutKindFromString(obj.value("layout").toString());
        const QJsonArray keywords = obj.value("keywords").toArray();
        for (const QJsonValue &kw : keywords) {
            sig.keywords << kw.toString();
        }
        if (sig.name.isEmpty() || sig.keywords.isEmpty()) {
            throw std::runtime_error("Bank registry entry needs a name and at least one keyword.");
        }
        signatures << sig;
    }
    qCInfo(lcBank) << "Loaded" << signatures.size() << "bank signature(s)";
    return std::make_shared<const BankRegistry>(std::move(signatures));
}

std::shared_ptr<const BankRegistry> BankRegistry::fromFile(const QString &path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        throw std::runtime_error(QString("Failed to open bank registry: %1").arg(path).toStdString());
    }
    return fromJson(f.readAll());
}

const BankSignature *BankRegistry::find(const QString &name) const {
    for (const BankSignature &sig : signatures_) {
        if (sig.name == name) return &sig;
    }
    return nullptr;
}

QMap<QString, QString> BankRegistry::supportedBanks() const {
    QMap<QString, QString> banks;
    for (const BankSignature &sig : signatures_) {
        if (!banks.contains(sig.name)) banks.insert(sig.name, sig.description);
    }
    return banks;
}

} // namespace comptaflow
