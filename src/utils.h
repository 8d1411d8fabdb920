#pragma once

#include <QString>
#include <QStringList>

namespace comptaflow {
// Given the path to a tesseract executable, attempt to locate a tessdata directory
// (Homebrew share/tessdata, a tessdata folder beside the binary, or the Debian
// /usr/share/tesseract-ocr/<version>/tessdata layout). Returns an empty string if not found.
QString findTessdataDir(const QString &tessExecutablePath);

// Picks the tessdata directory for OCR: explicit setting first, then the
// build-time COMPTAFLOW_TESSDATA_DIR, then discovery from the executable path.
// Empty means "let Tesseract use its default".
QString resolveTessdataDir(const QString &configured, const QString &tessExecutablePath);

// Trimmed, non-empty lines of a text.
QStringList nonEmptyLines(const QString &text);

} // namespace comptaflow
