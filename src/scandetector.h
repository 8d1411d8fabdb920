#pragma once
#include <QByteArray>
#include <QString>
#include <QStringList>
#include "pipelineconfig.h"

namespace comptaflow {

class TextExtractor;

// Decides whether a statement is image-only and needs OCR.
class ScanDetector {
public:
    explicit ScanDetector(const PipelineConfig &config);

    bool isScanned(const QStringList &pages) const;
    bool isScanned(const QString &text) const;

    // Extraction errors count as "not scanned": native parsing is tried first.
    bool isScanned(TextExtractor &extractor, const QByteArray &document) const;

    static const QStringList &domainKeywords();
    static int countWords(const QString &text);

private:
    int minChars_;
    int minWords_;
    int minKeywords_;
    int pages_;
};

} // namespace comptaflow
