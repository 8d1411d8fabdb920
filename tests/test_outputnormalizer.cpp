#include <gtest/gtest.h>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <stdexcept>
#include "outputnormalizer.h"

using namespace comptaflow;

TEST(OutputNormalizerTest, DropsRowsWithInvalidDate) {
    auto table = normalizeTransactions({
        { "15/03/2025", "BOULANGERIE PARIS", -12.5 },
        { "31/02/2025", "IMPOSSIBLE", -1.0 },
        { "pas une date", "TEXTE", -2.0 },
    });
    ASSERT_TRUE(table.has_value());
    ASSERT_EQ(table->rowCount(), 1);
    EXPECT_EQ(table->rows()[0].occurredOn, QDate(2025, 3, 15));
    EXPECT_EQ(table->rows()[0].label, QString("BOULANGERIE PARIS"));
}

TEST(OutputNormalizerTest, DropsRowsWithBlankLabel) {
    auto table = normalizeTransactions({
        { "15/03/2025", "  ", -12.5 },
        { "16/03/2025", " SNCF ", -40.0 },
    });
    ASSERT_TRUE(table.has_value());
    ASSERT_EQ(table->rowCount(), 1);
    EXPECT_EQ(table->rows()[0].label, QString("SNCF"));
}

TEST(OutputNormalizerTest, NothingValidGivesNoTable) {
    EXPECT_FALSE(normalizeTransactions({}).has_value());
    EXPECT_FALSE(normalizeTransactions({ { "99/99/2025", "X", 1.0 } }).has_value());
}

TEST(OutputNormalizerTest, CsvQuotesSpecialCharacters) {
    auto table = normalizeTransactions({
        { "01/11/2025", "VIREMENT SALAIRE", 2500.0 },
        { "02/11/2025", "RESTAURANT \"CHEZ PAUL\", LYON", -31.9 },
    });
    ASSERT_TRUE(table.has_value());
    const QString expected =
        QString::fromUtf8("Date,Libellé,Montant\n") +
        "01/11/2025,VIREMENT SALAIRE,2500.00\n"
        "02/11/2025,\"RESTAURANT \"\"CHEZ PAUL\"\", LYON\",-31.90\n";
    EXPECT_EQ(table->toCsv(), expected);
}

TEST(OutputNormalizerTest, TextColumnsArePadded) {
    auto table = normalizeTransactions({ { "01/11/2025", "CERTAS", -16.62 } });
    ASSERT_TRUE(table.has_value());
    const QStringList lines = table->toText().split('\n', Qt::SkipEmptyParts);
    ASSERT_EQ(lines.size(), 2);
    const int width = StatementTable::kColumnWidths[0] + StatementTable::kColumnWidths[1]
                      + StatementTable::kColumnWidths[2];
    EXPECT_EQ(lines[0].size(), width);
    EXPECT_EQ(lines[1].size(), width);
    EXPECT_TRUE(lines[1].startsWith("01/11/2025  CERTAS"));
    EXPECT_TRUE(lines[1].endsWith("-16.62"));
}

TEST(OutputNormalizerTest, WritesCsvFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    auto table = normalizeTransactions({ { "01/11/2025", "CERTAS", -16.62 } });
    ASSERT_TRUE(table.has_value());

    const QString path = QDir(dir.path()).filePath("out.csv");
    table->writeCsv(path);

    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::ReadOnly));
    EXPECT_EQ(QString::fromUtf8(f.readAll()), table->toCsv());
}

TEST(OutputNormalizerTest, UnwritablePathThrows) {
    StatementTable table({});
    EXPECT_THROW(table.writeCsv("/nonexistent-dir/out.csv"), std::runtime_error);
}

TEST(OutputNormalizerTest, AmountsUseTwoDecimals) {
    EXPECT_EQ(formatAmount(-54.0), QString("-54.00"));
    EXPECT_EQ(formatAmount(2500.5), QString("2500.50"));
}
