#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <vector>

#include "utils/json_formatter.hpp"

using json = nlohmann::json;

TEST(JsonFormatterTest, PredictionHasExactlyThreeKeys) {
  PredictionResult result;
  result.probability = 0.8127;
  result.linear_predictor = 1.4675;
  result.risk_category = RiskCategory::HIGH;
  result.contributions = {{"intercept", -5.0}, {"male", 0.35}};
  result.coefficients_version = "stemi-logit-demo-1";

  json j = JsonFormatter::prediction_to_json_object(result);

  ASSERT_TRUE(j.is_object());
  EXPECT_EQ(j.size(), 3u);
  EXPECT_DOUBLE_EQ(j["probability"].get<double>(), 0.8127);
  EXPECT_EQ(j["riskCategory"], "High");
  ASSERT_TRUE(j["contributions"].is_object());
  EXPECT_EQ(j["contributions"].size(), 2u);
  EXPECT_DOUBLE_EQ(j["contributions"]["male"].get<double>(), 0.35);
}

TEST(JsonFormatterTest, IssuePathsAreArrays) {
  std::vector<ValidationIssue> issues = {
      {"ageYears", IssueCode::OUT_OF_RANGE,
       "ageYears must be between 18 and 100, got 150"},
      {"", IssueCode::INVALID_ENVELOPE, "Request body must be a JSON object"}};

  json j = JsonFormatter::issues_to_json_array(issues);

  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 2u);
  EXPECT_EQ(j[0]["path"], json::array({"ageYears"}));
  EXPECT_EQ(j[0]["code"], "out_of_range");
  EXPECT_EQ(j[0]["message"], "ageYears must be between 18 and 100, got 150");
  EXPECT_EQ(j[1]["path"], json::array());
  EXPECT_EQ(j[1]["code"], "invalid_envelope");
}

TEST(JsonFormatterTest, ErrorObject) {
  EXPECT_EQ(JsonFormatter::error_to_json_object("Bad request"),
            json({{"error", "Bad request"}}));
}
