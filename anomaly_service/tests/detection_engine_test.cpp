#include <algorithm>
#include <memory>
#include <set>
#include <stdexcept>
#include <variant>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "detection_engine/detection_engine.hpp"
#include "errors/errors.hpp"
#include "test_helpers.hpp"

using namespace gl_anomaly;
using gl_anomaly::test::InMemoryDataSource;
using gl_anomaly::test::Item;
using gl_anomaly::test::YearFilter;

namespace {

// 30 ordinary amounts, one huge posting and one late evening posting.
std::vector<gl::LineItem> ExpenseLedger() {
    std::vector<gl::LineItem> items;
    for (int i = 0; i < 30; ++i) {
        items.push_back(Item("E" + std::to_string(i), 1000.0 + 50.0 * i));
    }
    items.push_back(Item("HUGE", 250000.0));
    items.push_back(Item("LATE", 1234.5).Time("23:00:00").User("U900", "Mallory"));
    return items;
}

// Round amounts on consecutive days plus a same-day duplicate pair.
std::vector<gl::LineItem> ProvisionLedger() {
    std::vector<gl::LineItem> items;
    for (int day = 1; day <= 6; ++day) {
        items.push_back(Item("P" + std::to_string(day), 5000.0)
                            .Account("600000")
                            .Date(fmt::format("2024-03-{:02}", day * 2)));
    }
    items.push_back(Item("DUP1", 777.0).Account("600000").Time("09:00:00"));
    items.push_back(Item("DUP2", 777.0).Account("600000").Time("11:00:00"));
    return items;
}

std::vector<gl::LineItem> Concat(std::vector<gl::LineItem> lhs, const std::vector<gl::LineItem>& rhs) {
    lhs.insert(lhs.end(), rhs.begin(), rhs.end());
    return lhs;
}

int SeverityRank(gl::Severity severity) {
    return static_cast<int>(severity);
}

// Everything but ids and timestamps.
std::string Fingerprint(const gl::Anomaly& anomaly) {
    std::string out = gl::AnomalyType_Name(anomaly.anomaly_type()) + "|" + gl::Severity_Name(anomaly.severity()) +
                      "|" + std::to_string(anomaly.score()) + "|" + anomaly.description();
    for (const auto& item : anomaly.line_items()) {
        out += "|" + item.document_number();
    }
    return out;
}

std::vector<std::string> Fingerprints(const gl::DetectionResult& result, std::optional<gl::AnomalyType> type = {}) {
    std::vector<std::string> out;
    for (const auto& anomaly : result.anomalies()) {
        if (!type || anomaly.anomaly_type() == *type) {
            out.push_back(Fingerprint(anomaly));
        }
    }
    return out;
}

class DetectionEngineTest : public ::testing::Test {
protected:
    DetectionEngine MakeEngine(const GLDataSource& source, DetectionConfig config = test::DefaultConfig()) {
        return DetectionEngine(source, std::move(config), ids_);
    }

    std::shared_ptr<SequenceIdGenerator> ids_ = std::make_shared<SequenceIdGenerator>();
};

}  // anonymous namespace

TEST_F(DetectionEngineTest, MissingFilterIsRejectedBeforeFetch) {
    InMemoryDataSource source(ExpenseLedger());
    const auto engine = MakeEngine(source);

    EXPECT_THROW(engine.DetectAnomalies("tenant-1", std::nullopt), InvalidFilterError);
    EXPECT_THROW(engine.DetectAnomalies("tenant-1", YearFilter("")), InvalidFilterError);
    EXPECT_EQ(source.FetchCount(), 0);
}

TEST_F(DetectionEngineTest, InvalidConfigIsRejected) {
    InMemoryDataSource source({});
    auto config = test::DefaultConfig();
    config.timezone = "Nowhere/Atlantis";
    EXPECT_THROW(MakeEngine(source, config), ConfigError);

    config = test::DefaultConfig();
    config.behavioral.after_hours_start = 24;
    EXPECT_THROW(MakeEngine(source, config), ConfigError);
}

TEST_F(DetectionEngineTest, EmptyBatchGivesEmptyResult) {
    InMemoryDataSource source({});
    auto filter = YearFilter();
    filter.set_fiscal_period("004");

    const auto result = MakeEngine(source).DetectAnomalies("tenant-1", filter);

    EXPECT_EQ(source.FetchCount(), 1);
    EXPECT_EQ(result.analysis_id(), "GLAD-000001");
    EXPECT_EQ(result.tenant_id(), "tenant-1");
    EXPECT_EQ(result.fiscal_year(), "2024");
    EXPECT_EQ(result.fiscal_period(), "004");
    EXPECT_FALSE(result.has_gl_account());
    EXPECT_EQ(result.total_line_items(), 0);
    EXPECT_EQ(result.anomalies_detected(), 0);
    EXPECT_EQ(result.anomalies_size(), 0);
    EXPECT_EQ(result.account_stats_size(), 0);
    EXPECT_TRUE(result.has_summary());
    EXPECT_DOUBLE_EQ(result.summary().estimated_fraud_risk(), 0.0);
    EXPECT_FALSE(result.completed_at().empty());
}

TEST_F(DetectionEngineTest, DataSourceErrorsPropagate) {
    test::FailingDataSource source;
    EXPECT_THROW(MakeEngine(source).DetectAnomalies("tenant-1", YearFilter()), std::runtime_error);
}

TEST_F(DetectionEngineTest, MalformedLineItemAbortsRun) {
    auto items = ExpenseLedger();
    items[3].clear_gl_account_name();
    InMemoryDataSource source(items);

    try {
        MakeEngine(source).DetectAnomalies("tenant-1", YearFilter());
        FAIL() << "expected MalformedLineItemError";
    } catch (const MalformedLineItemError& e) {
        EXPECT_EQ(e.DocumentNumber(), "E3");
    }
}

TEST_F(DetectionEngineTest, UnparsablePostingTimeAbortsRun) {
    auto items = ExpenseLedger();
    items[0].set_posting_time("quarter past ten");
    InMemoryDataSource source(items);

    EXPECT_THROW(MakeEngine(source).DetectAnomalies("tenant-1", YearFilter()), MalformedLineItemError);
}

TEST_F(DetectionEngineTest, DetectsOutlierAndAfterHoursPosting) {
    InMemoryDataSource source(ExpenseLedger());

    const auto result = MakeEngine(source).DetectAnomalies("tenant-1", YearFilter());

    EXPECT_EQ(result.total_line_items(), 32);
    ASSERT_EQ(result.anomalies_detected(), 2);
    ASSERT_EQ(result.anomalies_size(), 2);

    const auto& outlier = result.anomalies(0);
    EXPECT_EQ(outlier.anomaly_type(), gl::STATISTICAL_OUTLIER);
    EXPECT_EQ(outlier.severity(), gl::CRITICAL);
    EXPECT_EQ(outlier.line_items(0).document_number(), "HUGE");
    EXPECT_EQ(outlier.anomaly_id().rfind("OUTLIER-", 0), 0u);

    const auto& late = result.anomalies(1);
    EXPECT_EQ(late.anomaly_type(), gl::AFTER_HOURS_POSTING);
    EXPECT_EQ(late.severity(), gl::LOW);
    EXPECT_EQ(late.details().posting_pattern().user_id(), "U900");

    const auto& summary = result.summary();
    EXPECT_EQ(summary.critical_anomalies(), 1);
    EXPECT_EQ(summary.low_anomalies(), 1);
    EXPECT_EQ(summary.by_type().at("STATISTICAL_OUTLIER"), 1);
    EXPECT_EQ(summary.by_type().at("AFTER_HOURS_POSTING"), 1);
    // 15 for the critical anomaly, +10 for a 6.25% anomaly rate
    EXPECT_DOUBLE_EQ(summary.estimated_fraud_risk(), 25.0);

    ASSERT_EQ(result.account_stats_size(), 1);
    EXPECT_EQ(result.account_stats(0).total_transactions(), 32);
    EXPECT_EQ(result.benford_analysis_size(), 0);
}

TEST_F(DetectionEngineTest, ResultInvariants) {
    InMemoryDataSource source(Concat(ExpenseLedger(), ProvisionLedger()));

    const auto result = MakeEngine(source).DetectAnomalies("tenant-1", YearFilter());
    const auto& summary = result.summary();

    EXPECT_EQ(result.anomalies_detected(), result.anomalies_size());
    EXPECT_EQ(summary.critical_anomalies() + summary.high_anomalies() + summary.medium_anomalies() +
                  summary.low_anomalies(),
              result.anomalies_detected());

    std::set<std::string> documents;
    for (const auto& item : Concat(ExpenseLedger(), ProvisionLedger())) {
        documents.insert(item.document_number());
    }
    std::set<std::string> ids;
    for (int i = 0; i < result.anomalies_size(); ++i) {
        const auto& anomaly = result.anomalies(i);
        EXPECT_GE(anomaly.score(), 0.0);
        EXPECT_LE(anomaly.score(), 100.0);
        EXPECT_GE(anomaly.details().confidence(), 0.0);
        EXPECT_LE(anomaly.details().confidence(), 100.0);
        EXPECT_EQ(anomaly.status(), gl::Anomaly::OPEN);
        ASSERT_GE(anomaly.line_items_size(), 1);
        for (const auto& item : anomaly.line_items()) {
            EXPECT_TRUE(documents.count(item.document_number()));
        }
        EXPECT_TRUE(ids.insert(anomaly.anomaly_id()).second);
        if (i > 0) {
            EXPECT_GE(SeverityRank(result.anomalies(i - 1).severity()), SeverityRank(anomaly.severity()));
        }
    }
    EXPECT_GE(summary.estimated_fraud_risk(), 0.0);
    EXPECT_LE(summary.estimated_fraud_risk(), 100.0);
    EXPECT_EQ(result.account_stats_size(), 2);
}

TEST_F(DetectionEngineTest, RepeatedRunsAgreeApartFromIdsAndTimestamps) {
    InMemoryDataSource source(Concat(ExpenseLedger(), ProvisionLedger()));
    const auto engine = MakeEngine(source);

    const auto first = engine.DetectAnomalies("tenant-1", YearFilter());
    const auto second = engine.DetectAnomalies("tenant-1", YearFilter());

    EXPECT_NE(first.analysis_id(), second.analysis_id());
    EXPECT_EQ(Fingerprints(first), Fingerprints(second));
    EXPECT_DOUBLE_EQ(first.summary().estimated_fraud_risk(), second.summary().estimated_fraud_risk());
}

TEST_F(DetectionEngineTest, DetectorsAreIndependent) {
    InMemoryDataSource source(Concat(ExpenseLedger(), ProvisionLedger()));
    const auto everything = MakeEngine(source).DetectAnomalies("tenant-1", YearFilter());

    auto round_only = test::QuietConfig();
    round_only.round_numbers.enabled = true;
    const auto rounds = MakeEngine(source, round_only).DetectAnomalies("tenant-1", YearFilter());

    auto duplicates_only = test::QuietConfig();
    duplicates_only.duplicates.enabled = true;
    const auto duplicates = MakeEngine(source, duplicates_only).DetectAnomalies("tenant-1", YearFilter());

    ASSERT_EQ(rounds.anomalies_size(), 1);
    EXPECT_EQ(rounds.anomalies(0).gl_account(), "600000");
    EXPECT_EQ(rounds.anomalies(0).line_items_size(), 6);
    EXPECT_EQ(Fingerprints(rounds), Fingerprints(everything, gl::ROUND_NUMBER_PATTERN));

    ASSERT_EQ(duplicates.anomalies_size(), 1);
    EXPECT_EQ(duplicates.anomalies(0).details().duplicate().document_numbers(0), "DUP1");
    EXPECT_EQ(Fingerprints(duplicates), Fingerprints(everything, gl::DUPLICATE_ENTRY));
}

TEST_F(DetectionEngineTest, BenfordRunsPerQualifyingAccount) {
    std::vector<gl::LineItem> items;
    for (int i = 0; i < 100; ++i) {
        items.push_back(Item("N" + std::to_string(i), 9000.0 + i).Account("500000"));
    }
    InMemoryDataSource source(items);
    auto config = test::QuietConfig();
    config.benford.enabled = true;

    auto filter = YearFilter();
    filter.add_gl_accounts("500000");
    const auto result = MakeEngine(source, config).DetectAnomalies("tenant-1", filter);

    EXPECT_EQ(result.gl_account(), "500000");
    ASSERT_EQ(result.benford_analysis_size(), 1);
    EXPECT_TRUE(result.benford_analysis(0).is_anomalous());
    ASSERT_EQ(result.anomalies_size(), 1);
    EXPECT_EQ(result.anomalies(0).anomaly_type(), gl::BENFORD_LAW_VIOLATION);
    EXPECT_EQ(result.anomalies(0).severity(), gl::HIGH);
    EXPECT_EQ(result.anomalies(0).line_items_size(), 100);
}

TEST_F(DetectionEngineTest, VelocityObservationsAreReported) {
    std::vector<gl::LineItem> items;
    for (int period = 1; period <= 3; ++period) {
        for (int i = 0; i < 5; ++i) {
            items.push_back(Item(fmt::format("V{}-{}", period, i), 100.0).Period(fmt::format("{:03}", period)));
        }
    }
    for (int i = 0; i < 40; ++i) {
        items.push_back(Item(fmt::format("V4-{}", i), 100.0).Period("004"));
    }
    InMemoryDataSource source(items);
    auto config = test::QuietConfig();
    config.velocity.enabled = true;

    const auto result = MakeEngine(source, config).DetectAnomalies("tenant-1", YearFilter());

    ASSERT_EQ(result.velocity_observations_size(), 1);
    EXPECT_EQ(result.velocity_observations(0).period(), "2024-004");
    ASSERT_EQ(result.anomalies_size(), 1);
    EXPECT_EQ(result.anomalies(0).severity(), gl::CRITICAL);
    EXPECT_EQ(result.anomalies(0).line_items_size(), 40);
}

TEST(MakeDetectionEngineTest, RunsWithGeneratedIds) {
    InMemoryDataSource source(ExpenseLedger());

    const auto engine = MakeDetectionEngine(test::DefaultConfig(), source);
    const auto first = engine->DetectAnomalies("tenant-1", YearFilter());
    const auto second = engine->DetectAnomalies("tenant-1", YearFilter());

    EXPECT_EQ(first.analysis_id().rfind("GLAD-", 0), 0u);
    EXPECT_GT(first.analysis_id().size(), std::string("GLAD-").size());
    EXPECT_NE(first.analysis_id(), second.analysis_id());
    ASSERT_EQ(first.anomalies_size(), 2);
    EXPECT_NE(first.anomalies(0).anomaly_id(), first.anomalies(1).anomaly_id());
    EXPECT_EQ(Fingerprints(first), Fingerprints(second));
}

TEST(MakeDetectionEngineTest, RejectsUnknownTimezone) {
    InMemoryDataSource source({});
    auto config = test::DefaultConfig();
    config.timezone = "Mars/Olympus_Mons";

    EXPECT_THROW(MakeDetectionEngine(config, source), ConfigError);
}

TEST(RuleIsolationTest, FailingRuleIsRecordedAndOthersKeepTheirFindings) {
    const std::vector<gl::LineItem> items = {Item("A1", 100.0), Item("A2", 200.0), Item("A3", 300.0)};
    const auto emit = [](const gl::LineItem& item) {
        OutlierObservation observation;
        observation.line_item = &item;
        return observation;
    };

    std::vector<DetectorFinding> findings;
    google::protobuf::RepeatedPtrField<std::string> diagnostics;

    EXPECT_TRUE(RunRuleIsolated("after-hours", [&](std::vector<DetectorFinding>& out) {
        out.emplace_back(emit(items[0]));
    }, findings, diagnostics));
    EXPECT_FALSE(RunRuleIsolated("weekend", [&](std::vector<DetectorFinding>& out) {
        out.emplace_back(emit(items[1]));
        throw std::runtime_error("calendar lookup failed");
    }, findings, diagnostics));
    EXPECT_TRUE(RunRuleIsolated("duplicate-detection", [&](std::vector<DetectorFinding>& out) {
        out.emplace_back(emit(items[2]));
    }, findings, diagnostics));

    ASSERT_EQ(findings.size(), 2u);
    EXPECT_EQ(std::get<OutlierObservation>(findings[0]).line_item->document_number(), "A1");
    EXPECT_EQ(std::get<OutlierObservation>(findings[1]).line_item->document_number(), "A3");
    ASSERT_EQ(diagnostics.size(), 1);
    EXPECT_EQ(diagnostics.Get(0), "weekend: calendar lookup failed");
}

TEST(FraudRiskTest, WeightsAndAnomalyRate) {
    std::vector<gl::Anomaly> anomalies(3);
    anomalies[0].set_severity(gl::CRITICAL);
    anomalies[1].set_severity(gl::CRITICAL);
    anomalies[2].set_severity(gl::HIGH);

    EXPECT_DOUBLE_EQ(EstimateFraudRisk(anomalies, 100), 38.0);
    EXPECT_DOUBLE_EQ(EstimateFraudRisk(anomalies, 50), 48.0);
    EXPECT_DOUBLE_EQ(EstimateFraudRisk(anomalies, 10), 58.0);

    std::vector<gl::Anomaly> many(10);
    for (auto& anomaly : many) anomaly.set_severity(gl::CRITICAL);
    EXPECT_DOUBLE_EQ(EstimateFraudRisk(many, 1000), 100.0);
}
