#include <gtest/gtest.h>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>

#include "models/feature_validator.hpp"
#include "models/features.hpp"
#include "test_helpers.hpp"

using json = nlohmann::json;

namespace {

const ValidationIssue *find_issue(const ValidationResult &result,
                                  const std::string &path) {
  for (const auto &issue : result.issues)
    if (issue.path == path)
      return &issue;
  return nullptr;
}

} // namespace

TEST(FeatureValidatorTest, AcceptsReferencePresentation) {
  FeatureValidator validator;
  ValidationResult result = validator.validate(reference_request());

  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.issues.empty());

  const FeatureRecord &record = *result.record;
  EXPECT_EQ(record.age_years(), 60);
  EXPECT_TRUE(record.male());
  EXPECT_TRUE(record.chest_pain_typical());
  EXPECT_DOUBLE_EQ(record.st_elevation_mm(), 2.0);
  EXPECT_TRUE(record.reciprocal_changes());
  EXPECT_DOUBLE_EQ(record.troponin_ng_l(), 80.0);
  EXPECT_EQ(record.heart_rate_bpm(), 90);
  EXPECT_EQ(record.systolic_bp(), 120);
  EXPECT_FALSE(record.smoker());
  EXPECT_FALSE(record.diabetes());

  EXPECT_DOUBLE_EQ(record.encoded(Feature::MALE), 1.0);
  EXPECT_DOUBLE_EQ(record.encoded(Feature::SMOKER), 0.0);
}

TEST(FeatureValidatorTest, ReportsEveryIndependentError) {
  json raw = reference_request();
  raw["ageYears"] = 150;
  raw.erase("heartRateBpm");

  ValidationResult result = FeatureValidator().validate(raw);

  ASSERT_FALSE(result.ok());
  ASSERT_EQ(result.issues.size(), 2u);
  // Schema order
  EXPECT_EQ(result.issues[0].path, "ageYears");
  EXPECT_EQ(result.issues[0].code, IssueCode::OUT_OF_RANGE);
  EXPECT_EQ(result.issues[1].path, "heartRateBpm");
  EXPECT_EQ(result.issues[1].code, IssueCode::MISSING);
}

TEST(FeatureValidatorTest, EmptyObjectReportsAllTenFields) {
  ValidationResult result = FeatureValidator().validate(json::object());

  ASSERT_FALSE(result.ok());
  ASSERT_EQ(result.issues.size(), kFeatureCount);
  for (size_t i = 0; i < kFeatureCount; ++i) {
    EXPECT_EQ(result.issues[i].path, feature_schema()[i].name);
    EXPECT_EQ(result.issues[i].code, IssueCode::MISSING);
  }
}

TEST(FeatureValidatorTest, AgeBoundariesAreInclusive) {
  FeatureValidator validator;

  for (int age : {18, 100}) {
    json raw = reference_request();
    raw["ageYears"] = age;
    EXPECT_TRUE(validator.validate(raw).ok()) << "age " << age;
  }

  for (int age : {17, 101}) {
    json raw = reference_request();
    raw["ageYears"] = age;
    ValidationResult result = validator.validate(raw);
    ASSERT_FALSE(result.ok()) << "age " << age;
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].path, "ageYears");
    EXPECT_EQ(result.issues[0].code, IssueCode::OUT_OF_RANGE);
    EXPECT_NE(result.issues[0].message.find("ageYears"), std::string::npos);
  }
}

TEST(FeatureValidatorTest, NumericBoundsForEveryContinuousField) {
  FeatureValidator validator;

  struct Case {
    const char *field;
    double inside_low;
    double inside_high;
    double below;
    double above;
  };
  const Case cases[] = {
      {"stElevationMm", 0.0, 10.0, -0.5, 10.5},
      {"troponinNgL", 0.0, 100000.0, -1.0, 100000.5},
      {"heartRateBpm", 30, 220, 29, 221},
      {"systolicBp", 60, 240, 59, 241},
  };

  for (const auto &c : cases) {
    for (double v : {c.inside_low, c.inside_high}) {
      json raw = reference_request();
      raw[c.field] = v;
      EXPECT_TRUE(validator.validate(raw).ok()) << c.field << "=" << v;
    }
    for (double v : {c.below, c.above}) {
      json raw = reference_request();
      raw[c.field] = v;
      ValidationResult result = validator.validate(raw);
      ASSERT_FALSE(result.ok()) << c.field << "=" << v;
      const ValidationIssue *issue = find_issue(result, c.field);
      ASSERT_NE(issue, nullptr);
      EXPECT_EQ(issue->code, IssueCode::OUT_OF_RANGE);
    }
  }
}

TEST(FeatureValidatorTest, NumericStringsAreNotCoerced) {
  json raw = reference_request();
  raw["ageYears"] = "60";
  raw["troponinNgL"] = "80";

  ValidationResult result = FeatureValidator().validate(raw);

  ASSERT_FALSE(result.ok());
  ASSERT_EQ(result.issues.size(), 2u);
  EXPECT_EQ(result.issues[0].code, IssueCode::WRONG_TYPE);
  EXPECT_EQ(result.issues[1].code, IssueCode::WRONG_TYPE);
  EXPECT_NE(result.issues[0].message.find("string"), std::string::npos);
}

TEST(FeatureValidatorTest, BooleansMustBeJsonBooleans) {
  FeatureValidator validator;

  for (const json &bad : {json(1), json(0), json("true"), json(nullptr)}) {
    json raw = reference_request();
    raw["male"] = bad;
    ValidationResult result = validator.validate(raw);
    ASSERT_FALSE(result.ok()) << bad.dump();
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].path, "male");
    EXPECT_EQ(result.issues[0].code, IssueCode::WRONG_TYPE);
  }
}

TEST(FeatureValidatorTest, NumbersRejectBooleansNullAndContainers) {
  FeatureValidator validator;

  for (const json &bad :
       {json(true), json(nullptr), json::array({60}), json::object()}) {
    json raw = reference_request();
    raw["systolicBp"] = bad;
    ValidationResult result = validator.validate(raw);
    ASSERT_FALSE(result.ok()) << bad.dump();
    EXPECT_EQ(result.issues[0].code, IssueCode::WRONG_TYPE);
  }
}

TEST(FeatureValidatorTest, NonFiniteNumbersAreRejected) {
  json raw = reference_request();
  raw["troponinNgL"] = std::numeric_limits<double>::quiet_NaN();
  raw["stElevationMm"] = std::numeric_limits<double>::infinity();

  ValidationResult result = FeatureValidator().validate(raw);

  ASSERT_FALSE(result.ok());
  ASSERT_EQ(result.issues.size(), 2u);
  EXPECT_EQ(find_issue(result, "troponinNgL")->code, IssueCode::NOT_FINITE);
  EXPECT_EQ(find_issue(result, "stElevationMm")->code, IssueCode::NOT_FINITE);
}

TEST(FeatureValidatorTest, IntegerFieldsRequireIntegralValues) {
  FeatureValidator validator;

  json fractional = reference_request();
  fractional["heartRateBpm"] = 90.5;
  ValidationResult result = validator.validate(fractional);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.issues[0].path, "heartRateBpm");
  EXPECT_EQ(result.issues[0].code, IssueCode::NOT_INTEGER);

  json integral_real = reference_request();
  integral_real["heartRateBpm"] = 90.0;
  ValidationResult accepted = validator.validate(integral_real);
  ASSERT_TRUE(accepted.ok());
  EXPECT_EQ(accepted.record->heart_rate_bpm(), 90);
}

TEST(FeatureValidatorTest, StElevationOffStepIsAccepted) {
  json raw = reference_request();
  raw["stElevationMm"] = 2.25;

  ValidationResult result = FeatureValidator().validate(raw);

  ASSERT_TRUE(result.ok());
  EXPECT_DOUBLE_EQ(result.record->st_elevation_mm(), 2.25);
}

TEST(FeatureValidatorTest, UnknownFieldsIgnoredByDefault) {
  json raw = reference_request();
  raw["patientName"] = "redacted";

  FeatureValidator validator;
  EXPECT_FALSE(validator.rejects_unknown_fields());
  ValidationResult result = validator.validate(raw);

  ASSERT_TRUE(result.ok());
  EXPECT_EQ(*result.record, validated(reference_request()));
}

TEST(FeatureValidatorTest, UnknownFieldsRejectedWhenConfigured) {
  json raw = reference_request();
  raw["zeta"] = 1;
  raw["alpha"] = 2;

  ValidationResult result = FeatureValidator(true).validate(raw);

  ASSERT_FALSE(result.ok());
  ASSERT_EQ(result.issues.size(), 2u);
  EXPECT_EQ(result.issues[0].path, "alpha");
  EXPECT_EQ(result.issues[0].code, IssueCode::UNKNOWN_FIELD);
  EXPECT_EQ(result.issues[1].path, "zeta");
}

TEST(FeatureValidatorTest, NonObjectInputIsAnEnvelopeError) {
  FeatureValidator validator;

  for (const json &bad : {json::array(), json(42), json("text"), json(nullptr)}) {
    ValidationResult result = validator.validate(bad);
    ASSERT_FALSE(result.ok()) << bad.dump();
    EXPECT_TRUE(result.is_envelope_error());
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_TRUE(result.issues[0].path.empty());
  }

  ValidationResult field_errors = validator.validate(json::object());
  EXPECT_FALSE(field_errors.is_envelope_error());
}

TEST(FeatureValidatorTest, IssueCodeNames) {
  EXPECT_STREQ(issue_code_to_string(IssueCode::MISSING), "missing");
  EXPECT_STREQ(issue_code_to_string(IssueCode::OUT_OF_RANGE), "out_of_range");
  EXPECT_STREQ(issue_code_to_string(IssueCode::INVALID_ENVELOPE),
               "invalid_envelope");
}

TEST(FeaturesTest, SchemaNamesRoundTrip) {
  for (const auto &spec : feature_schema()) {
    EXPECT_EQ(get_feature_name(spec.feature), spec.name);
    auto back = feature_from_name(spec.name);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, spec.feature);
  }
  EXPECT_FALSE(feature_from_name("AgeYears").has_value());
  EXPECT_EQ(get_feature_name(Feature::FEATURE_COUNT), "UNKNOWN_FEATURE");
}
