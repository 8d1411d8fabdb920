#include "scandetector.h"
#include "logging.h"
#include "textextractor.h"
#include <QRegularExpression>
#include <stdexcept>

namespace comptaflow {

ScanDetector::ScanDetector(const PipelineConfig &config)
    : minChars_(config.scanMinChars),
      minWords_(config.scanMinWords),
      minKeywords_(config.scanMinKeywords),
      pages_(config.scanPages)
{
}

const QStringList &ScanDetector::domainKeywords() {
    static const QStringList keywords = {
        "BANQUE", "CREDIT", "COMPTE", "RELEVE", "TRANSACTION",
        "DEBIT", "CARTE", "PAIEMENT", "MONTANT", "DATE", "LCL"
    };
    return keywords;
}

int ScanDetector::countWords(const QString &text) {
    // Latin-1 letters cover French accents.
    static const QRegularExpression wordRe(
        "\\b[A-Za-z\\x{00C0}-\\x{00FF}]{3,}\\b",
        QRegularExpression::UseUnicodePropertiesOption);
    int count = 0;
    auto it = wordRe.globalMatch(text);
    while (it.hasNext()) {
        it.next();
        ++count;
    }
    return count;
}

bool ScanDetector::isScanned(const QStringList &pages) const {
    if (pages.isEmpty()) {
        qCInfo(lcScan) << "Document has no pages, treated as scanned";
        return true;
    }

    const QString text = pages.mid(0, pages_).join(QString());
    const int chars = text.trimmed().size();
    if (chars < minChars_) {
        qCInfo(lcScan) << "Scanned:" << chars << "characters";
        return true;
    }

    const int words = countWords(text);
    if (words < minWords_) {
        qCInfo(lcScan) << "Scanned:" << words << "words";
        return true;
    }

    const QString upper = text.toUpper();
    int found = 0;
    for (const QString &kw : domainKeywords()) {
        if (upper.contains(kw)) ++found;
    }
    if (found >= minKeywords_) {
        qCInfo(lcScan) << "Native:" << words << "words," << found << "banking keywords";
        return false;
    }

    qCInfo(lcScan) << "Scanned: only" << found << "banking keyword(s)";
    return true;
}

bool ScanDetector::isScanned(const QString &text) const {
    return isScanned(QStringList{text});
}

bool ScanDetector::isScanned(TextExtractor &extractor, const QByteArray &document) const {
    try {
        return isScanned(extractor.extractPages(document));
    } catch (const std::exception &ex) {
        qCWarning(lcScan) << "Scan detection failed, assuming native:" << ex.what();
        return false;
    }
}

} // namespace comptaflow
