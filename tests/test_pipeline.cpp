#include <gtest/gtest.h>
#include <memory>
#include "bankregistry.h"
#include "fakes.h"
#include "pipeline.h"

using namespace comptaflow;
using comptaflow::fakes::FakeCompletionClient;
using comptaflow::fakes::FakeOcrEngine;
using comptaflow::fakes::FakeTextExtractor;

namespace {

const char *kLlmReply = R"([{"date":"30/10/2025","libelle":"CERTAS","montant":-16.62},
                            {"date":"01/11/2025","libelle":"VIREMENT SALAIRE","montant":2500.00}])";

// Passes the scan heuristics: long, wordy, with banking vocabulary.
QString statementPage(const QString &header, const QStringList &rows) {
    QStringList words;
    for (int i = 0; i < 60; ++i) words << "operation";
    QStringList lines;
    lines << header << "RELEVE DE COMPTE - PAIEMENT PAR CARTE" << "Date Commerce Montant" << words.join(' ');
    lines << rows;
    return lines.join('\n');
}

QString creditAgricolePage() {
    return statementPage("CREDIT AGRICOLE ALPES PROVENCE",
                         { "15.03 BOULANGERIE PARIS 12,50", "16.03 SNCF INTERNET 45,00" });
}

class PipelineTest : public ::testing::Test {
protected:
    PipelineTest() {
        config_.defaultYear = 2025;
    }

    Pipeline makePipeline(QStringList pages,
                          std::shared_ptr<OcrEngine> ocr = nullptr,
                          std::shared_ptr<CompletionClient> llm = nullptr,
                          bool extractorFails = false) const {
        return Pipeline(config_, BankRegistry::builtin(),
                        std::make_shared<FakeTextExtractor>(std::move(pages), extractorFails),
                        std::move(ocr), std::move(llm));
    }

    PipelineConfig config_;
    const QByteArray document_ = "%PDF-1.4 test";
};

} // namespace

TEST_F(PipelineTest, LayoutTierWinsOnNativeText) {
    auto llm = std::make_shared<FakeCompletionClient>(kLlmReply);
    Pipeline pipeline = makePipeline({ creditAgricolePage() }, nullptr, llm);

    ExtractionResult result = pipeline.extract(document_);
    ASSERT_TRUE(result.succeeded());
    EXPECT_FALSE(result.failure.has_value());
    EXPECT_EQ(result.outcome->method, ExtractionMethod::NativeRegex);
    EXPECT_EQ(result.outcome->bank, QString("CA"));
    ASSERT_EQ(result.outcome->transactions.size(), 2);
    EXPECT_EQ(result.outcome->transactions[0].occurredOn, QDate(2025, 3, 15));
    EXPECT_DOUBLE_EQ(result.outcome->transactions[1].amount, -45.0);
    EXPECT_EQ(llm->calls, 0);
}

TEST_F(PipelineTest, FallsBackToLanguageModel) {
    auto llm = std::make_shared<FakeCompletionClient>(kLlmReply);
    Pipeline pipeline = makePipeline({ statementPage("CREDIT AGRICOLE", {}) }, nullptr, llm);

    ExtractionResult result = pipeline.extract(document_);
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.outcome->method, ExtractionMethod::Llm);
    EXPECT_EQ(result.outcome->transactions.size(), 2);
    EXPECT_EQ(llm->calls, 1);
    EXPECT_TRUE(llm->lastPrompt.contains("detected bank: CA"));
}

TEST_F(PipelineTest, LanguageModelFirstWhenConfigured) {
    config_.tierOrder = TierOrder::LlmFirst;
    auto llm = std::make_shared<FakeCompletionClient>(kLlmReply);
    Pipeline pipeline = makePipeline({ creditAgricolePage() }, nullptr, llm);

    ExtractionResult result = pipeline.extract(document_);
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.outcome->method, ExtractionMethod::Llm);
    EXPECT_EQ(result.outcome->transactions[0].label, QString("CERTAS"));
}

TEST_F(PipelineTest, LanguageModelErrorFallsThroughToLayout) {
    config_.tierOrder = TierOrder::LlmFirst;
    auto llm = std::make_shared<FakeCompletionClient>(QString(), true);
    Pipeline pipeline = makePipeline({ creditAgricolePage() }, nullptr, llm);

    ExtractionResult result = pipeline.extract(document_);
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.outcome->method, ExtractionMethod::NativeRegex);
    EXPECT_EQ(llm->calls, 1);
}

TEST_F(PipelineTest, ScannedDocumentStopsWhenOcrFails) {
    auto ocr = std::make_shared<FakeOcrEngine>(QString(), true);
    auto llm = std::make_shared<FakeCompletionClient>(kLlmReply);
    Pipeline pipeline = makePipeline({ "" }, ocr, llm);

    ExtractionResult result = pipeline.extract(document_);
    ASSERT_FALSE(result.succeeded());
    EXPECT_EQ(result.failure->kind, ExtractionFailure::Kind::Scanned);
    EXPECT_EQ(result.failure->validation.errorKind, ValidationResult::ErrorKind::Scanned);
    EXPECT_FALSE(result.failure->validation.supportedBanks.isEmpty());
    EXPECT_EQ(ocr->calls, 1);
    EXPECT_EQ(llm->calls, 0);
}

TEST_F(PipelineTest, OcrTextFeedsLayoutTier) {
    auto ocr = std::make_shared<FakeOcrEngine>(creditAgricolePage());
    Pipeline pipeline = makePipeline({ "  " }, ocr);

    ExtractionResult result = pipeline.extract(document_);
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.outcome->method, ExtractionMethod::OcrRegex);
    EXPECT_EQ(result.outcome->transactions.size(), 2);
}

TEST_F(PipelineTest, OcrIsSkippedWhenDisabled) {
    config_.ocrEnabled = false;
    auto ocr = std::make_shared<FakeOcrEngine>(creditAgricolePage());
    Pipeline pipeline = makePipeline({ "" }, ocr);

    ExtractionResult result = pipeline.extract(document_);
    ASSERT_FALSE(result.succeeded());
    EXPECT_EQ(result.failure->kind, ExtractionFailure::Kind::Scanned);
    EXPECT_EQ(ocr->calls, 0);
}

TEST_F(PipelineTest, UnsupportedBankStopsBeforeTiers) {
    auto llm = std::make_shared<FakeCompletionClient>(kLlmReply);
    Pipeline pipeline = makePipeline({ statementPage("BANQUE EXEMPLE", { "15.03 BOULANGERIE 12,50" }) }, nullptr, llm);

    ExtractionResult result = pipeline.extract(document_);
    ASSERT_FALSE(result.succeeded());
    EXPECT_EQ(result.failure->kind, ExtractionFailure::Kind::BankNotSupported);
    EXPECT_FALSE(result.failure->validation.compatible);
    EXPECT_EQ(result.failure->validation.supportedBanks.size(), 3);
    EXPECT_EQ(llm->calls, 0);
}

TEST_F(PipelineTest, CorruptDocumentIsUnreadable) {
    Pipeline pipeline = makePipeline({}, nullptr, nullptr, true);

    ExtractionResult result;
    EXPECT_NO_THROW(result = pipeline.extract(document_));
    ASSERT_FALSE(result.succeeded());
    EXPECT_EQ(result.failure->kind, ExtractionFailure::Kind::Unreadable);
    EXPECT_EQ(result.failure->validation.errorKind, ValidationResult::ErrorKind::Unreadable);
}

TEST_F(PipelineTest, NoTierFindsAnything) {
    Pipeline pipeline = makePipeline({ statementPage("CREDIT AGRICOLE", {}) });

    ExtractionResult result = pipeline.extract(document_);
    ASSERT_FALSE(result.succeeded());
    EXPECT_EQ(result.failure->kind, ExtractionFailure::Kind::NoTransactionsFound);
    EXPECT_TRUE(result.failure->validation.compatible);
}

TEST_F(PipelineTest, InvalidDatesFromWinningTierFailTheDocument) {
    auto llm = std::make_shared<FakeCompletionClient>(kLlmReply);
    Pipeline pipeline = makePipeline({ statementPage("CREDIT AGRICOLE", { "31.02 BOULANGERIE PARIS 12,50" }) },
                                     nullptr, llm);

    ExtractionResult result = pipeline.extract(document_);
    ASSERT_FALSE(result.succeeded());
    EXPECT_EQ(result.failure->kind, ExtractionFailure::Kind::NoTransactionsFound);
    EXPECT_EQ(llm->calls, 0);
}

TEST_F(PipelineTest, EstimatesTransactionsPerBank) {
    Pipeline pipeline = makePipeline({});
    EXPECT_EQ(pipeline.estimateTransactions(creditAgricolePage(), "CA"), 2);
    EXPECT_EQ(pipeline.estimateTransactions(creditAgricolePage(), "UNKNOWN"), 0);
}

TEST_F(PipelineTest, ValidateUsesOwnScanCheck) {
    Pipeline pipeline = makePipeline({});
    EXPECT_TRUE(pipeline.validate(creditAgricolePage()).compatible);
    EXPECT_EQ(pipeline.validate("CREDIT AGRICOLE").errorKind, ValidationResult::ErrorKind::Scanned);
}

TEST_F(PipelineTest, InspectReportsWhatWasRead) {
    Pipeline pipeline = makePipeline({ creditAgricolePage(), "page deux" });

    DocumentReport report = pipeline.inspect(document_);
    EXPECT_EQ(report.pageCount, 2);
    EXPECT_FALSE(report.scanned);
    EXPECT_TRUE(report.keywordHits.value("CA").contains("CREDIT AGRICOLE"));
    EXPECT_EQ(report.firstLines.first(), QString("CREDIT AGRICOLE ALPES PROVENCE"));
    EXPECT_EQ(report.validation.bank, QString("CA"));
}

TEST_F(PipelineTest, FailureKindNames) {
    EXPECT_EQ(failureKindName(ExtractionFailure::Kind::BankNotSupported), QString("BANK_NOT_SUPPORTED"));
}
