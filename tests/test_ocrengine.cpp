#include <gtest/gtest.h>
#include <QColor>
#include <QImage>
#include <leptonica/allheaders.h>
#include <stdexcept>
#include "ocrengine.h"

using namespace comptaflow;

namespace {

// Light grey page with dark horizontal bars standing in for text lines.
QImage syntheticPage() {
    QImage image(400, 300, QImage::Format_RGB32);
    image.fill(QColor(225, 225, 225));
    for (int line = 0; line < 8; ++line) {
        const int top = 30 + line * 30;
        for (int y = top; y < top + 8; ++y) {
            for (int x = 40; x < 360; ++x) {
                image.setPixel(x, y, qRgb(30, 30, 30));
            }
        }
    }
    return image;
}

} // namespace

TEST(OcrEngineTest, ImageConvertsToPix) {
    PixPtr pix = pixFromImage(syntheticPage());
    ASSERT_TRUE(pix);
    EXPECT_EQ(pixGetWidth(pix.get()), 400);
    EXPECT_EQ(pixGetHeight(pix.get()), 300);
}

TEST(OcrEngineTest, PreprocessingYieldsBinaryImage) {
    PixPtr pix = pixFromImage(syntheticPage());
    PixPtr prepared = preprocessPage(pix.get());
    ASSERT_TRUE(prepared);
    EXPECT_EQ(pixGetDepth(prepared.get()), 1);
    EXPECT_EQ(pixGetWidth(prepared.get()), 400);
    EXPECT_EQ(pixGetHeight(prepared.get()), 300);
}

TEST(OcrEngineTest, PreprocessingNullPageThrows) {
    EXPECT_THROW(preprocessPage(nullptr), std::runtime_error);
}

TEST(OcrEngineTest, NullImageCannotBeConverted) {
    EXPECT_THROW(pixFromImage(QImage()), std::runtime_error);
}
