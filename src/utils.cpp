#include "utils.h"
#include <QFileInfo>
#include <QDir>

namespace comptaflow {

QString findTessdataDir(const QString &tessExecutablePath) {
    if (tessExecutablePath.isEmpty()) return QString();

    QFileInfo fi(tessExecutablePath);
    QString binDir = fi.absolutePath();
    QDir d(binDir);

    // parent/share/tessdata (Homebrew, /usr/local installs)
    d.cdUp();
    if (d.exists("share/tessdata")) {
        return d.absoluteFilePath("share/tessdata");
    }

    if (QDir(binDir).exists("tessdata")) {
        return QDir(binDir).absoluteFilePath("tessdata");
    }

    // Debian/Ubuntu: /usr/share/tesseract-ocr/<version>/tessdata
    QDir tessRoot("/usr/share/tesseract-ocr");
    if (tessRoot.exists()) {
        if (tessRoot.exists("tessdata")) {
            return tessRoot.absoluteFilePath("tessdata");
        }
        const QStringList versionDirs = tessRoot.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name | QDir::Reversed);
        for (const QString &ver : versionDirs) {
            QDir verDir = tessRoot;
            verDir.cd(ver);
            if (verDir.exists("tessdata")) {
                return verDir.absoluteFilePath("tessdata");
            }
        }
    }

    return QString();
}

QString resolveTessdataDir(const QString &configured, const QString &tessExecutablePath) {
    if (!configured.isEmpty()) return configured;
#ifdef COMPTAFLOW_TESSDATA_DIR
    return QString(COMPTAFLOW_TESSDATA_DIR);
#else
    return findTessdataDir(tessExecutablePath);
#endif
}

QStringList nonEmptyLines(const QString &text) {
    QStringList lines;
    const QStringList raw = text.split('\n');
    for (const QString &line : raw) {
        const QString t = line.trimmed();
        if (!t.isEmpty()) lines << t;
    }
    return lines;
}

} // namespace comptaflow
