#include "ocrengine.h"
#include "logging.h"
#include "textextractor.h"
#include "utils.h"
#include <QBuffer>
#include <QImage>
#include <QPdfDocument>
#include <QStringList>
#include <QTemporaryFile>
#include <tesseract/baseapi.h>
#include <leptonica/allheaders.h>
#include <stdexcept>

namespace comptaflow {

namespace {

// Contrast normalization tiles, in pixels.
const int kContrastTile = 100;
const int kContrastMinDiff = 50;
const int kContrastSmooth = 2;
const int kMedianWindow = 3;
const int kSauvolaHalfWindow = 7;
const float kSauvolaFactor = 0.34f;

QImage renderPage(QPdfDocument &doc, int pageIndex, int dpi) {
    QSizeF pageSize = doc.pagePointSize(pageIndex);
    double scale = dpi / 72.0;
    int w = static_cast<int>(pageSize.width() * scale);
    int h = static_cast<int>(pageSize.height() * scale);

    QImage image = doc.render(pageIndex, QSize(w, h));
    if (image.isNull()) {
        throw std::runtime_error(QString("Failed to render PDF page %1").arg(pageIndex + 1).toStdString());
    }
    return image;
}

} // namespace

void PixDeleter::operator()(Pix *pix) const {
    pixDestroy(&pix);
}

PixPtr pixFromImage(const QImage &image) {
    QByteArray png;
    QBuffer buffer(&png);
    buffer.open(QIODevice::WriteOnly);
    if (!image.save(&buffer, "PNG")) {
        throw std::runtime_error("Failed to encode rendered page");
    }

    PixPtr pix(pixReadMem(reinterpret_cast<const l_uint8 *>(png.constData()), png.size()));
    if (!pix) {
        throw std::runtime_error("Failed to read image into Leptonica Pix object.");
    }
    return pix;
}

PixPtr preprocessPage(Pix *page) {
    if (!page) {
        throw std::runtime_error("No image to preprocess");
    }

    PixPtr gray(pixConvertTo8(page, 0));
    if (!gray) {
        throw std::runtime_error("Failed to convert page to grayscale");
    }

    PixPtr contrasted(pixContrastNorm(nullptr, gray.get(), kContrastTile, kContrastTile,
                                      kContrastMinDiff, kContrastSmooth, kContrastSmooth));
    if (!contrasted) {
        throw std::runtime_error("Failed to normalize page contrast");
    }

    PixPtr denoised(pixRankFilterGray(contrasted.get(), kMedianWindow, kMedianWindow, 0.5f));
    if (!denoised) {
        throw std::runtime_error("Failed to denoise page");
    }

    Pix *binary = nullptr;
    if (pixSauvolaBinarize(denoised.get(), kSauvolaHalfWindow, kSauvolaFactor, 1,
                           nullptr, nullptr, nullptr, &binary) != 0 || !binary) {
        throw std::runtime_error("Failed to binarize page");
    }
    return PixPtr(binary);
}

TesseractOcrEngine::TesseractOcrEngine(const PipelineConfig &config)
    : dpi_(config.dpi),
      language_(config.ocrLanguage),
      tessdataDir_(resolveTessdataDir(config.tessdataDir, config.tesseractPath))
{
}

QString TesseractOcrEngine::recognize(const QByteArray &document) {
    QTemporaryFile tmp;
    QPdfDocument doc;
    loadPdfDocument(doc, tmp, document);

    const int pageCount = doc.pageCount();
    qCInfo(lcOcr) << "Rendering" << pageCount << "page(s) at" << dpi_ << "dpi";

    const QByteArray datapath = tessdataDir_.toUtf8();
    const QByteArray lang = language_.toUtf8();

    tesseract::TessBaseAPI api;
    if (api.Init(datapath.isEmpty() ? nullptr : datapath.constData(), lang.constData())) {
        throw std::runtime_error(
            QString("Could not initialize tesseract for lang %1 (datapath=%2)")
            .arg(language_, tessdataDir_.isEmpty() ? "default" : tessdataDir_)
            .toStdString()
        );
    }
    api.SetPageSegMode(tesseract::PSM_SINGLE_BLOCK);

    QStringList results;
    for (int i = 0; i < pageCount; ++i) {
        qCInfo(lcOcr) << "OCR page" << i + 1 << "/" << pageCount;

        PixPtr raw = pixFromImage(renderPage(doc, i, dpi_));
        PixPtr prepared = preprocessPage(raw.get());

        api.SetImage(prepared.get());
        api.SetSourceResolution(dpi_);
        if (api.Recognize(nullptr) != 0) {
            api.End();
            throw std::runtime_error(QString("Recognition failed on page %1").arg(i + 1).toStdString());
        }

        std::unique_ptr<char[]> out(api.GetUTF8Text());
        QString text = out ? QString::fromUtf8(out.get()) : QString();
        qCDebug(lcOcr) << "Page" << i + 1 << ":" << text.size() << "characters";
        results << text;
        api.Clear();
    }
    api.End();
    doc.close();

    QString fullText = results.join("\n\n");
    qCInfo(lcOcr) << "OCR finished:" << fullText.size() << "characters";
    return fullText;
}

} // namespace comptaflow
