#include <gtest/gtest.h>

#include "models/risk_category.hpp"

TEST(RiskCategoryTest, BandEdgesAreClosedBelowOpenAbove) {
  RiskThresholds thresholds; // 0.15 / 0.50

  EXPECT_EQ(thresholds.classify(0.0), RiskCategory::LOW);
  EXPECT_EQ(thresholds.classify(0.1499999), RiskCategory::LOW);
  EXPECT_EQ(thresholds.classify(0.15), RiskCategory::INTERMEDIATE);
  EXPECT_EQ(thresholds.classify(0.4999999), RiskCategory::INTERMEDIATE);
  EXPECT_EQ(thresholds.classify(0.50), RiskCategory::HIGH);
  EXPECT_EQ(thresholds.classify(1.0), RiskCategory::HIGH);
}

TEST(RiskCategoryTest, PartitionIsMonotonic) {
  for (const RiskThresholds &thresholds :
       {RiskThresholds{}, RiskThresholds{0.05, 0.2}, RiskThresholds{0.3, 0.9}}) {
    RiskCategory previous = RiskCategory::LOW;
    for (int i = 0; i <= 10000; ++i) {
      double p = i / 10000.0;
      RiskCategory current = thresholds.classify(p);
      EXPECT_GE(static_cast<int>(current), static_cast<int>(previous))
          << "p=" << p;
      previous = current;
    }
    EXPECT_EQ(thresholds.classify(0.0), RiskCategory::LOW);
    EXPECT_EQ(thresholds.classify(1.0), RiskCategory::HIGH);
  }
}

TEST(RiskCategoryTest, DisplayNames) {
  EXPECT_STREQ(risk_category_to_string(RiskCategory::LOW), "Low");
  EXPECT_STREQ(risk_category_to_string(RiskCategory::INTERMEDIATE),
               "Intermediate");
  EXPECT_STREQ(risk_category_to_string(RiskCategory::HIGH), "High");
}
