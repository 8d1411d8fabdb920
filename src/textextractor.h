#pragma once
#include <QByteArray>
#include <QString>
#include <QStringList>

class QPdfDocument;
class QTemporaryFile;

namespace comptaflow {

// Spools `bytes` into `storage` and loads it into `doc`; QPdfDocument loads
// synchronously only from a file path. Throws std::runtime_error on failure.
void loadPdfDocument(QPdfDocument &doc, QTemporaryFile &storage, const QByteArray &bytes);

// Text of a document, one entry per page, in page order.
class TextExtractor {
public:
    virtual ~TextExtractor() = default;

    // Throws std::runtime_error when the document cannot be opened.
    virtual QStringList extractPages(const QByteArray &document) = 0;

    // Pages joined with '\n'. An unreadable document gives an empty string.
    QString extract(const QByteArray &document);

    static QString joinPages(const QStringList &pages);
};

// Native PDF text through Qt PDF.
class PdfTextExtractor : public TextExtractor {
public:
    QStringList extractPages(const QByteArray &document) override;
};

} // namespace comptaflow
