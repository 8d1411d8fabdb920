#pragma once
#include <QByteArray>
#include <QString>
#include <memory>
#include "pipelineconfig.h"

struct Pix;
class QImage;

namespace comptaflow {

// Image-to-text backend for scanned statements.
class OcrEngine {
public:
    virtual ~OcrEngine() = default;

    // Text of every page, pages separated by a blank line. Any failure throws
    // std::runtime_error; no partial result is returned.
    virtual QString recognize(const QByteArray &document) = 0;
};

struct PixDeleter {
    void operator()(Pix *pix) const;
};
using PixPtr = std::unique_ptr<Pix, PixDeleter>;

// Leptonica chain applied before recognition: grayscale, local contrast
// normalization, median denoise, Sauvola binarization. Returns a 1 bpp image.
PixPtr preprocessPage(Pix *page);

PixPtr pixFromImage(const QImage &image);

class TesseractOcrEngine : public OcrEngine {
public:
    explicit TesseractOcrEngine(const PipelineConfig &config);

    QString recognize(const QByteArray &document) override;

private:
    int dpi_;
    QString language_;
    QString tessdataDir_;
};

} // namespace comptaflow
