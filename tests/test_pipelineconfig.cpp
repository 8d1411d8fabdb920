#include <gtest/gtest.h>
#include <QDate>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <stdexcept>
#include "pipelineconfig.h"

using namespace comptaflow;

namespace {

class PipelineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char *name : { "MISTRAL_API_KEY", "COMPTAFLOW_DEBUG", "COMPTAFLOW_TESSDATA", "COMPTAFLOW_TIER_ORDER" }) {
            qunsetenv(name);
        }
        ASSERT_TRUE(dir_.isValid());
    }

    void TearDown() override {
        qunsetenv("MISTRAL_API_KEY");
        qunsetenv("COMPTAFLOW_TIER_ORDER");
    }

    QString writeIni(const QByteArray &contents, const QString &name = "comptaflow.ini") {
        const QString path = QDir(dir_.path()).filePath(name);
        QFile f(path);
        EXPECT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Text));
        f.write(contents);
        f.close();
        return path;
    }

    QTemporaryDir dir_;
};

} // namespace

TEST_F(PipelineConfigTest, MissingFileKeepsDefaults) {
    PipelineConfig config = loadConfig(QDir(dir_.path()).filePath("absent.ini"));
    EXPECT_EQ(config.scanMinChars, 200);
    EXPECT_EQ(config.scanMinWords, 50);
    EXPECT_EQ(config.scanMinKeywords, 2);
    EXPECT_EQ(config.nearEmptyThreshold, 100);
    EXPECT_EQ(config.unreadableThreshold, 50);
    EXPECT_EQ(config.llmCharBudget, 8000);
    EXPECT_EQ(config.dpi, 300);
    EXPECT_EQ(config.tierOrder, TierOrder::LayoutFirst);
    EXPECT_TRUE(config.llmApiKey.isEmpty());
}

TEST_F(PipelineConfigTest, ReadsIniGroups) {
    const QString path = writeIni(
        "[scan]\nmin_chars=150\n"
        "[ocr]\nenabled=false\ndpi=200\nlanguage=fra+eng\n"
        "[llm]\nchar_budget=4000\nmodel=mistral-large-latest\n"
        "[pipeline]\ntier_order=llm-first\ndefault_year=2024\n");
    PipelineConfig config = loadConfig(path);
    EXPECT_EQ(config.scanMinChars, 150);
    EXPECT_FALSE(config.ocrEnabled);
    EXPECT_EQ(config.dpi, 200);
    EXPECT_EQ(config.ocrLanguage, QString("fra+eng"));
    EXPECT_EQ(config.llmCharBudget, 4000);
    EXPECT_EQ(config.llmModel, QString("mistral-large-latest"));
    EXPECT_EQ(config.tierOrder, TierOrder::LlmFirst);
    EXPECT_EQ(config.effectiveYear(), 2024);
}

TEST_F(PipelineConfigTest, EnvironmentOverridesFile) {
    const QString path = writeIni("[llm]\napi_key=from-file\n[pipeline]\ntier_order=llm-first\n");
    qputenv("MISTRAL_API_KEY", "from-env");
    qputenv("COMPTAFLOW_TIER_ORDER", "layout-first");
    PipelineConfig config = loadConfig(path);
    EXPECT_EQ(config.llmApiKey, QString("from-env"));
    EXPECT_EQ(config.tierOrder, TierOrder::LayoutFirst);
}

TEST_F(PipelineConfigTest, InvalidValuesThrow) {
    EXPECT_THROW(loadConfig(writeIni("[pipeline]\ntier_order=sideways\n", "order.ini")), std::runtime_error);
    EXPECT_THROW(loadConfig(writeIni("[ocr]\ndpi=10\n", "dpi.ini")), std::runtime_error);
    EXPECT_THROW(loadConfig(writeIni("[llm]\nchar_budget=0\n", "budget.ini")), std::runtime_error);
}

TEST_F(PipelineConfigTest, TierOrderNames) {
    EXPECT_EQ(tierOrderFromString(" Regex "), TierOrder::LayoutFirst);
    EXPECT_EQ(tierOrderFromString("LLM"), TierOrder::LlmFirst);
    EXPECT_EQ(tierOrderName(TierOrder::LlmFirst), QString("llm-first"));
    EXPECT_EQ(tierOrderFromString(tierOrderName(TierOrder::LayoutFirst)), TierOrder::LayoutFirst);
}

TEST_F(PipelineConfigTest, ZeroYearMeansCurrentYear) {
    PipelineConfig config;
    EXPECT_EQ(config.effectiveYear(), QDate::currentDate().year());
    config.defaultYear = 2023;
    EXPECT_EQ(config.effectiveYear(), 2023);
}
