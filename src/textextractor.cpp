#include "textextractor.h"
#include "logging.h"
#include <QPdfDocument>
#include <QPdfSelection>
#include <QTemporaryFile>
#include <stdexcept>

namespace comptaflow {

void loadPdfDocument(QPdfDocument &doc, QTemporaryFile &storage, const QByteArray &bytes) {
    if (bytes.isEmpty()) {
        throw std::runtime_error("Empty document");
    }
    storage.setFileTemplate(storage.fileTemplate() + ".pdf");
    if (!storage.open()) {
        throw std::runtime_error("Failed to create temporary file for PDF");
    }
    if (storage.write(bytes) != bytes.size() || !storage.flush()) {
        throw std::runtime_error("Failed to write temporary PDF");
    }
    if (doc.load(storage.fileName()) != QPdfDocument::Error::None) {
        throw std::runtime_error("Failed to open PDF");
    }
}

QString TextExtractor::joinPages(const QStringList &pages) {
    return pages.join("\n");
}

QString TextExtractor::extract(const QByteArray &document) {
    try {
        return joinPages(extractPages(document));
    } catch (const std::exception &ex) {
        qCWarning(lcText) << "Text extraction failed:" << ex.what();
        return QString();
    }
}

QStringList PdfTextExtractor::extractPages(const QByteArray &document) {
    QTemporaryFile tmp;
    QPdfDocument doc;
    loadPdfDocument(doc, tmp, document);

    QStringList pages;
    const int pageCount = doc.pageCount();
    for (int i = 0; i < pageCount; ++i) {
        QString text = doc.getAllText(i).text();
        qCDebug(lcText) << "Page" << i + 1 << ":" << text.size() << "characters";
        pages << text;
    }
    doc.close();

    qCInfo(lcText) << "Extracted" << pages.size() << "page(s)";
    return pages;
}

} // namespace comptaflow
