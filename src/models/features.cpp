#include "features.hpp"

namespace {

const std::array<FeatureSpec, kFeatureCount> kSchema = {{
    {Feature::AGE_YEARS, "ageYears", FeatureKind::INTEGER, 18, 100},
    {Feature::MALE, "male", FeatureKind::BOOLEAN, 0, 1},
    {Feature::CHEST_PAIN_TYPICAL, "chestPainTypical", FeatureKind::BOOLEAN, 0,
     1},
    {Feature::ST_ELEVATION_MM, "stElevationMm", FeatureKind::REAL, 0, 10},
    {Feature::RECIPROCAL_CHANGES, "reciprocalChanges", FeatureKind::BOOLEAN, 0,
     1},
    {Feature::TROPONIN_NG_L, "troponinNgL", FeatureKind::REAL, 0, 100000},
    {Feature::HEART_RATE_BPM, "heartRateBpm", FeatureKind::INTEGER, 30, 220},
    {Feature::SYSTOLIC_BP, "systolicBp", FeatureKind::INTEGER, 60, 240},
    {Feature::SMOKER, "smoker", FeatureKind::BOOLEAN, 0, 1},
    {Feature::DIABETES, "diabetes", FeatureKind::BOOLEAN, 0, 1},
}};

} // namespace

std::string get_feature_name(Feature f) {
  if (feature_index(f) >= kFeatureCount)
    return "UNKNOWN_FEATURE";
  return kSchema[feature_index(f)].name;
}

std::optional<Feature> feature_from_name(std::string_view name) {
  for (const auto &spec : kSchema)
    if (name == spec.name)
      return spec.feature;
  return std::nullopt;
}

const std::array<FeatureSpec, kFeatureCount> &feature_schema() {
  return kSchema;
}

const FeatureSpec &feature_spec(Feature f) { return kSchema[feature_index(f)]; }
