#include "llmextractor.h"
#include "dates.h"
#include "logging.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QRegularExpression>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace comptaflow {

namespace {

// Largest DDMMYYYY value.
const double kMaxCompactDate = 99999999.0;

const QString kDateKey = QStringLiteral("date");
const QString kLabelKey = QStringLiteral("libelle");
const QString kAmountKey = QStringLiteral("montant");

std::optional<QString> dateField(const QJsonValue &v) {
    if (v.isString()) return normalizeDate(v.toString());
    if (v.isDouble()) {
        const double d = v.toDouble();
        if (d >= 0 && d <= kMaxCompactDate && std::floor(d) == d) {
            return normalizeDate(QString::number(static_cast<qint64>(d)));
        }
    }
    return std::nullopt;
}

std::optional<double> amountField(const QJsonValue &v) {
    if (v.isDouble()) return v.toDouble();
    if (v.isString()) {
        bool ok = false;
        const double d = v.toString().trimmed().toDouble(&ok);
        if (ok && std::isfinite(d)) return d;
    }
    return std::nullopt;
}

} // namespace

LlmExtractor::LlmExtractor(std::shared_ptr<CompletionClient> client, const PipelineConfig &config)
    : client_(std::move(client)),
      charBudget_(config.llmCharBudget),
      debug_(config.debug)
{
}

QString LlmExtractor::buildPrompt(const QString &text, const std::optional<QString> &bankHint) const {
    const QString limited = text.left(charBudget_);
    const QString bankContext = bankHint ? QString(" (detected bank: %1)").arg(*bankHint) : QString();

    return QString(
        "You extract transactions from French bank statements.\n"
        "Read the statement below%1 and return EVERY visible transaction as strict JSON.\n"
        "\n"
        "Statement:\n"
        "%2\n"
        "\n"
        "Expected output, exactly this shape:\n"
        "[\n"
        "  {\"date\": \"30/10/2025\", \"libelle\": \"CERTAS ESSOF024\", \"montant\": -16.62},\n"
        "  {\"date\": \"01/11/2025\", \"libelle\": \"VIREMENT SALAIRE\", \"montant\": 2500.00}\n"
        "]\n"
        "\n"
        "Rules:\n"
        "1. date: DD/MM/YYYY.\n"
        "2. montant: negative for debits and purchases, positive for credits and received transfers; "
        "decimal point, never a comma.\n"
        "3. libelle: merchant or operation name, without the date.\n"
        "4. Include debits AND credits.\n"
        "5. A line containing \"CREDIT\" or \"VIREMENT RECU\" has a positive montant.\n"
        "6. Answer with the JSON array only: no markdown, no text before or after.\n")
        .arg(bankContext, limited);
}

ParsedReply LlmExtractor::parseReply(const QString &reply, bool debug) {
    QString cleaned = reply;
    cleaned.replace(QStringLiteral("```json"), QString()).replace(QStringLiteral("```"), QString());
    cleaned = cleaned.trimmed();

    static const QRegularExpression arrayRe("\\[.*\\]", QRegularExpression::DotMatchesEverythingOption);
    QRegularExpressionMatch m = arrayRe.match(cleaned);
    if (!m.hasMatch()) {
        throw std::runtime_error("No JSON array in model reply");
    }

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(m.captured(0).toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isArray()) {
        throw std::runtime_error(QString("Malformed JSON in model reply: %1").arg(err.errorString()).toStdString());
    }

    ParsedReply parsed;
    const QJsonArray items = doc.array();
    parsed.rawCount = items.size();

    for (int idx = 0; idx < items.size(); ++idx) {
        auto reject = [&](const QString &why) {
            ++parsed.rejected;
            if (debug) {
                qCDebug(lcLlm) << "record" << idx + 1 << "rejected:" << why << items[idx];
            }
        };

        if (!items[idx].isObject()) {
            reject("not an object");
            continue;
        }
        const QJsonObject obj = items[idx].toObject();
        if (!obj.contains(kDateKey) || !obj.contains(kLabelKey) || !obj.contains(kAmountKey)) {
            reject("missing field");
            continue;
        }

        const std::optional<QString> date = dateField(obj.value(kDateKey));
        if (!date) {
            reject("invalid date");
            continue;
        }
        const std::optional<double> amount = amountField(obj.value(kAmountKey));
        if (!amount) {
            reject("invalid amount");
            continue;
        }
        const QString label = obj.value(kLabelKey).toString().trimmed();
        if (label.isEmpty()) {
            reject("empty label");
            continue;
        }

        parsed.transactions.push_back({ *date, label, *amount });
    }

    if (debug) {
        qCDebug(lcLlm) << "validated:" << parsed.transactions.size()
                       << "rejected:" << parsed.rejected << "raw:" << parsed.rawCount;
    }
    return parsed;
}

TierResult LlmExtractor::extract(const QString &text, const std::optional<QString> &bankHint) const {
    if (!client_) {
        return TierResult::error("no language model configured");
    }
    if (text.size() > charBudget_) {
        qCInfo(lcLlm) << "Text truncated from" << text.size() << "to" << charBudget_ << "characters";
    }

    try {
        qCInfo(lcLlm) << "Requesting extraction from language model";
        const QString reply = client_->complete(buildPrompt(text, bankHint));
        qCInfo(lcLlm) << "Reply received:" << reply.size() << "characters";
        if (debug_) {
            qCDebug(lcLlm).noquote() << reply;
        }

        ParsedReply parsed = parseReply(reply, debug_);
        qCInfo(lcLlm) << parsed.transactions.size() << "transaction(s) validated," << parsed.rejected << "rejected";
        if (parsed.transactions.isEmpty()) {
            return TierResult::empty(QString("%1 record(s) rejected").arg(parsed.rejected));
        }
        return TierResult::success(std::move(parsed.transactions));
    } catch (const std::exception &ex) {
        qCWarning(lcLlm) << "Language model extraction failed:" << ex.what();
        return TierResult::error(QString::fromUtf8(ex.what()));
    }
}

} // namespace comptaflow
