#include <gtest/gtest.h>

#include "anomaly_builder/anomaly_builder.hpp"
#include "id_generator/id_generator.hpp"
#include "test_helpers.hpp"

using namespace gl_anomaly;
using gl_anomaly::test::Item;

namespace {

constexpr const char* kDetectedAt = "2024-03-14T08:00:00+0000";

class AnomalyBuilderTest : public ::testing::Test {
protected:
    gl::Anomaly Build(const DetectorFinding& finding) { return ToAnomaly(finding, ids_, kDetectedAt); }

    SequenceIdGenerator ids_;
};

}  // anonymous namespace

TEST(IdGeneratorTest, SequenceIsDeterministic) {
    SequenceIdGenerator ids;
    EXPECT_EQ(ids.Generate(), "000001");
    EXPECT_EQ(ids.Generate(), "000002");
    ids.Reset(42);
    EXPECT_EQ(ids.Generate(), "000042");
}

TEST(IdGeneratorTest, UuidsAreUnique) {
    UuidIdGenerator ids;
    const auto first = ids.Generate();
    const auto second = ids.Generate();
    EXPECT_FALSE(first.empty());
    EXPECT_NE(first, second);
}

TEST_F(AnomalyBuilderTest, OutlierScoreIsClamped) {
    const gl::LineItem item = Item("D1", -90000.0);
    OutlierObservation outlier;
    outlier.line_item = &item;
    outlier.method = gl::Z_SCORE;
    outlier.score = 7.5;
    outlier.threshold = 3.0;
    outlier.deviation = 85000.0;
    outlier.population_mean = 5000.0;
    outlier.population_std = 11000.0;

    const auto anomaly = Build(outlier);

    EXPECT_EQ(anomaly.anomaly_id(), "OUTLIER-000001");
    EXPECT_EQ(anomaly.anomaly_type(), gl::STATISTICAL_OUTLIER);
    EXPECT_EQ(anomaly.severity(), gl::CRITICAL);
    EXPECT_DOUBLE_EQ(anomaly.score(), 100.0);
    EXPECT_EQ(anomaly.status(), gl::Anomaly::OPEN);
    EXPECT_EQ(anomaly.detected_at(), kDetectedAt);
    EXPECT_EQ(anomaly.gl_account(), "400000");
    EXPECT_EQ(anomaly.gl_account_name(), "Operating Expenses");
    ASSERT_EQ(anomaly.line_items_size(), 1);
    EXPECT_EQ(anomaly.line_items(0).document_number(), "D1");
    EXPECT_DOUBLE_EQ(anomaly.details().confidence(), 85.0);
    ASSERT_TRUE(anomaly.details().has_outlier());
    EXPECT_DOUBLE_EQ(anomaly.details().outlier().population_mean(), 5000.0);
    EXPECT_EQ(anomaly.recommendation(), "URGENT: Investigate unusual transaction amount");
    EXPECT_NE(anomaly.description().find("90000.00 EUR"), std::string::npos);
}

TEST_F(AnomalyBuilderTest, OutlierSeverityBands) {
    EXPECT_EQ(OutlierSeverity(5.1), gl::CRITICAL);
    EXPECT_EQ(OutlierSeverity(3.5), gl::HIGH);
    EXPECT_EQ(OutlierSeverity(1.2), gl::MEDIUM);
}

TEST_F(AnomalyBuilderTest, ReversalAttachesBothItems) {
    const gl::LineItem original = Item("ORIG", 5000.0);
    const gl::LineItem reversal = Item("REV", -5000.0).Reverses("ORIG");
    ReversalMatch match{&original, &reversal, 0.5, 24.0, gl::HIGH};

    const auto anomaly = Build(BehavioralMatch{match});

    EXPECT_EQ(anomaly.anomaly_id(), "REVERSAL-000001");
    EXPECT_EQ(anomaly.anomaly_type(), gl::SAME_DAY_REVERSAL);
    ASSERT_EQ(anomaly.line_items_size(), 2);
    EXPECT_EQ(anomaly.line_items(0).document_number(), "ORIG");
    EXPECT_EQ(anomaly.line_items(1).document_number(), "REV");
    EXPECT_DOUBLE_EQ(anomaly.score(), 100.0);
    EXPECT_DOUBLE_EQ(anomaly.details().confidence(), 100.0);
    EXPECT_EQ(anomaly.details().reversal().reversal_document(), "REV");
    EXPECT_DOUBLE_EQ(anomaly.details().reversal().hours_between_postings(), 0.5);
    EXPECT_EQ(anomaly.description(), "Document ORIG reversed within 0.5 hours (amount: 5000.00 EUR)");
}

TEST_F(AnomalyBuilderTest, ReversalEvidenceAmountIsAbsolute) {
    const gl::LineItem original = Item("CR1", -1200.0).Credit();
    const gl::LineItem reversal = Item("CR1-REV", 1200.0).Reverses("CR1");
    ReversalMatch match{&original, &reversal, 2.0, 24.0, gl::MEDIUM};

    const auto anomaly = Build(BehavioralMatch{match});

    EXPECT_DOUBLE_EQ(anomaly.details().reversal().amount(), 1200.0);
    EXPECT_EQ(anomaly.description(), "Document CR1 reversed within 2.0 hours (amount: 1200.00 EUR)");
}

TEST_F(AnomalyBuilderTest, PostingPatternKinds) {
    const gl::LineItem late = Item("D1", 400.0).Time("22:30:00");
    PostingPatternMatch after_hours{gl::AFTER_HOURS_POSTING, "400000", "U100", {&late}, 400.0, gl::LOW};
    PostingPatternMatch weekend{gl::WEEKEND_POSTING, "400000", "U100", {&late}, 400.0, gl::LOW};

    const auto first = Build(BehavioralMatch{after_hours});
    const auto second = Build(BehavioralMatch{weekend});

    EXPECT_EQ(first.anomaly_id(), "AFTER_HOURS-000001");
    EXPECT_DOUBLE_EQ(first.score(), 5.0);
    EXPECT_DOUBLE_EQ(first.details().confidence(), 95.0);
    ASSERT_EQ(first.details().posting_pattern().posting_times_size(), 1);
    EXPECT_EQ(first.details().posting_pattern().posting_times(0), "22:30:00");
    EXPECT_EQ(first.description(), "User Alice made 1 posting(s) after hours (total: 400.00 EUR)");

    EXPECT_EQ(second.anomaly_id(), "WEEKEND-000002");
    EXPECT_EQ(second.anomaly_type(), gl::WEEKEND_POSTING);
    EXPECT_DOUBLE_EQ(second.score(), 4.0);
    EXPECT_DOUBLE_EQ(second.details().confidence(), 90.0);
    EXPECT_EQ(second.recommendation(), "Review weekend activity for business justification");
}

TEST_F(AnomalyBuilderTest, BenfordScoreFollowsPValue) {
    gl::BenfordResult result;
    result.set_gl_account("500000");
    result.set_total_transactions(100);
    result.set_chi_square_statistic(1800.0);
    result.set_p_value(0.001);
    result.set_is_anomalous(true);
    result.set_severity(gl::HIGH);
    const double actual[] = {0, 0, 0, 0, 0, 0, 0, 0, 100};
    const double expected[] = {30.1, 17.6, 12.5, 9.7, 7.9, 6.7, 5.8, 5.1, 4.6};
    for (int i = 0; i < 9; ++i) {
        result.add_actual_distribution(actual[i]);
        result.add_expected_distribution(expected[i]);
    }
    const gl::LineItem item = Item("D1", 9000.0).Account("500000");

    const auto anomaly = Build(BenfordFinding{result, {&item}});

    EXPECT_EQ(anomaly.anomaly_id(), "BENFORD-000001");
    EXPECT_NEAR(anomaly.score(), 99.9, 1e-9);
    EXPECT_NEAR(anomaly.details().confidence(), 99.9, 1e-9);
    EXPECT_EQ(anomaly.details().benford().largest_deviation().digit(), 9);
    EXPECT_EQ(anomaly.details().benford().actual_distribution_size(), 9);
    EXPECT_EQ(anomaly.recommendation(), "URGENT: Investigate for potential fraud or systematic data manipulation");
}

TEST_F(AnomalyBuilderTest, VelocityScoreFromLargestDeviation) {
    const gl::LineItem item = Item("D1", 100.0);
    VelocityMatch match;
    match.observation.set_gl_account("400000");
    match.observation.set_period("2024-005");
    match.observation.set_transaction_count(50);
    match.observation.set_count_deviation(400.0);
    match.observation.set_amount_deviation(-150.0);
    match.observation.set_severity(gl::HIGH);
    match.items = {&item};

    const auto anomaly = Build(match);

    EXPECT_EQ(anomaly.anomaly_id(), "VELOCITY-000001");
    EXPECT_DOUBLE_EQ(anomaly.score(), 80.0);
    EXPECT_EQ(anomaly.description(), "Unusual transaction velocity in period 2024-005: 50 transactions (+400% vs avg)");
}

TEST_F(AnomalyBuilderTest, DuplicateAndRoundNumber) {
    const gl::LineItem a = Item("D1", 2500.0);
    const gl::LineItem b = Item("D2", 2500.0);
    DuplicateMatch duplicate{{&a, &b}, 5000.0, gl::MEDIUM};
    RoundNumberMatch round{"400000", {&a, &b}, 4, 50.0, 5000.0, {1000, 5000}, gl::CRITICAL};

    const auto dup = Build(BehavioralMatch{duplicate});
    const auto rnd = Build(BehavioralMatch{round});

    EXPECT_EQ(dup.anomaly_id(), "DUPLICATE-000001");
    EXPECT_DOUBLE_EQ(dup.score(), 50.0);
    EXPECT_EQ(dup.details().duplicate().document_numbers_size(), 2);
    EXPECT_EQ(dup.recommendation(), "Review and remove duplicate entries");

    EXPECT_EQ(rnd.anomaly_id(), "ROUND_NUMBER-000002");
    EXPECT_DOUBLE_EQ(rnd.score(), 100.0);
    EXPECT_DOUBLE_EQ(rnd.details().confidence(), 75.0);
    EXPECT_EQ(rnd.details().round_number().example_documents_size(), 2);
}

TEST_F(AnomalyBuilderTest, FindingWithoutItemsIsRejected) {
    EXPECT_THROW(Build(BehavioralMatch{DuplicateMatch{}}), std::invalid_argument);
}
