#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QTextStream>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include "bankregistry.h"
#include "logging.h"
#include "mistralclient.h"
#include "ocrengine.h"
#include "outputnormalizer.h"
#include "pipeline.h"
#include "pipelineconfig.h"
#include "textextractor.h"

using namespace comptaflow;

namespace {

enum ExitCode { ExitOk = 0, ExitError = 1, ExitIncompatible = 2, ExitNoTransactions = 3 };

QByteArray readDocument(const QString &path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        throw std::runtime_error(QString("PDF not found: %1").arg(path).toStdString());
    }
    return f.readAll();
}

void printValidation(QTextStream &out, const ValidationResult &v) {
    out << "compatible: " << (v.compatible ? "yes" : "no") << "\n";
    out << "bank: " << v.bank.value_or("UNKNOWN") << "\n";
    out << "error: " << errorKindName(v.errorKind) << "\n";
    out << "message: " << v.message << "\n";
}

void printBanks(QTextStream &out, const BankRegistry &registry) {
    for (const BankSignature &sig : registry.signatures()) {
        out << sig.name.leftJustified(8) << sig.description.leftJustified(28)
            << layoutKindName(sig.layoutKind) << "\n";
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("comptaflow");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Convert bank statement PDFs into transaction tables.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("pdf", "Bank statement to convert.");

    QCommandLineOption configOpt({"c", "config"}, "INI configuration file.", "file");
    QCommandLineOption outputOpt({"o", "output"}, "Write the table to <file> instead of stdout.", "file");
    QCommandLineOption formatOpt("format", "Output format: csv or text.", "format", "csv");
    QCommandLineOption validateOpt("validate", "Only check whether the statement is supported.");
    QCommandLineOption inspectOpt("inspect", "Print what the pipeline sees in the document.");
    QCommandLineOption listBanksOpt("list-banks", "List supported banks and exit.");
    QCommandLineOption tierOrderOpt("tier-order", "layout-first or llm-first.", "order");
    QCommandLineOption noOcrOpt("no-ocr", "Never run optical recognition.");
    QCommandLineOption debugOpt("debug", "Verbose logging, including language model records.");
    parser.addOptions({ configOpt, outputOpt, formatOpt, validateOpt, inspectOpt,
                        listBanksOpt, tierOrderOpt, noOcrOpt, debugOpt });
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    try {
        PipelineConfig config = loadConfig(parser.value(configOpt));
        if (parser.isSet(tierOrderOpt)) config.tierOrder = tierOrderFromString(parser.value(tierOrderOpt));
        if (parser.isSet(noOcrOpt)) config.ocrEnabled = false;
        if (parser.isSet(debugOpt)) {
            config.debug = true;
            config.logLevel = LogLevel::Debug;
        }
        applyLogLevel(config.logLevel);

        std::shared_ptr<const BankRegistry> registry = config.bankRegistryPath.isEmpty()
            ? BankRegistry::builtin()
            : BankRegistry::fromFile(config.bankRegistryPath);

        if (parser.isSet(listBanksOpt)) {
            printBanks(out, *registry);
            return ExitOk;
        }

        const QStringList args = parser.positionalArguments();
        if (args.size() != 1) {
            err << "Usage: " << QCoreApplication::applicationName() << " [options] <pdf>\n";
            return ExitError;
        }
        const QByteArray document = readDocument(args.first());

        std::shared_ptr<CompletionClient> llm;
        if (!config.llmApiKey.isEmpty()) {
            llm = std::make_shared<MistralClient>(config);
        }
        Pipeline pipeline(config, registry,
                          std::make_shared<PdfTextExtractor>(),
                          std::make_shared<TesseractOcrEngine>(config),
                          llm);

        if (parser.isSet(inspectOpt)) {
            DocumentReport report = pipeline.inspect(document);
            out << "pages: " << report.pageCount << "\n";
            out << "text length: " << report.textLength << "\n";
            out << "scanned: " << (report.scanned ? "yes" : "no") << "\n";
            for (auto it = report.keywordHits.cbegin(); it != report.keywordHits.cend(); ++it) {
                out << "keywords " << it.key() << ": " << it.value().join(", ") << "\n";
            }
            printValidation(out, report.validation);
            out << "---\n";
            for (int i = 0; i < report.firstLines.size(); ++i) {
                out << QString("[%1] ").arg(i, 3) << report.firstLines[i] << "\n";
            }
            return ExitOk;
        }

        if (parser.isSet(validateOpt)) {
            PdfTextExtractor extractor;
            const QString text = extractor.extract(document);
            ValidationResult v = pipeline.validate(text);
            printValidation(out, v);
            if (v.compatible) {
                out << "estimated transactions: " << pipeline.estimateTransactions(text, *v.bank) << "\n";
                return ExitOk;
            }
            return ExitIncompatible;
        }

        ExtractionResult result = pipeline.extract(document);
        if (!result.succeeded()) {
            const ExtractionFailure &f = *result.failure;
            err << failureKindName(f.kind) << ": " << f.message << "\n";
            switch (f.kind) {
            case ExtractionFailure::Kind::Scanned:
            case ExtractionFailure::Kind::BankNotSupported:
                return ExitIncompatible;
            case ExtractionFailure::Kind::Unreadable:
            case ExtractionFailure::Kind::NoTransactionsFound:
                return ExitNoTransactions;
            case ExtractionFailure::Kind::ExtractionError:
                break;
            }
            return ExitError;
        }

        const ExtractionOutcome &outcome = *result.outcome;
        StatementTable table(outcome.transactions);
        const QString format = parser.value(formatOpt).toLower();
        if (format != "csv" && format != "text") {
            throw std::runtime_error(QString("Unknown format: %1").arg(format).toStdString());
        }

        if (parser.isSet(outputOpt)) {
            if (format == "csv") {
                table.writeCsv(parser.value(outputOpt));
            } else {
                QFile outf(parser.value(outputOpt));
                if (!outf.open(QIODevice::WriteOnly | QIODevice::Text)) {
                    throw std::runtime_error("Failed to open output file for writing.");
                }
                outf.write(table.toText().toUtf8());
            }
            err << table.rowCount() << " transaction(s) from " << outcome.bank.value_or("UNKNOWN")
                << " (" << extractionMethodName(outcome.method) << ") written to " << parser.value(outputOpt) << "\n";
        } else {
            out << (format == "csv" ? table.toCsv() : table.toText());
        }
        return ExitOk;
    } catch (const std::exception &ex) {
        err << "Error: " << ex.what() << "\n";
        return ExitError;
    }
}
