#ifndef FEATURE_RECORD_HPP
#define FEATURE_RECORD_HPP

#include "models/features.hpp"

#include <array>

class FeatureValidator;

// A validated, typed set of the ten clinical features. Only the validator can
// create one, so holding a FeatureRecord means every field is present and in
// range.
class FeatureRecord {
public:
  int age_years() const { return static_cast<int>(get(Feature::AGE_YEARS)); }
  bool male() const { return flag(Feature::MALE); }
  bool chest_pain_typical() const { return flag(Feature::CHEST_PAIN_TYPICAL); }
  double st_elevation_mm() const { return get(Feature::ST_ELEVATION_MM); }
  bool reciprocal_changes() const { return flag(Feature::RECIPROCAL_CHANGES); }
  double troponin_ng_l() const { return get(Feature::TROPONIN_NG_L); }
  int heart_rate_bpm() const {
    return static_cast<int>(get(Feature::HEART_RATE_BPM));
  }
  int systolic_bp() const { return static_cast<int>(get(Feature::SYSTOLIC_BP)); }
  bool smoker() const { return flag(Feature::SMOKER); }
  bool diabetes() const { return flag(Feature::DIABETES); }

  // Numeric encoding used by the scoring engine: booleans as 0/1, numbers as
  // given.
  double encoded(Feature f) const { return values_[feature_index(f)]; }

  bool operator==(const FeatureRecord &other) const {
    return values_ == other.values_;
  }

private:
  friend class FeatureValidator;

  explicit FeatureRecord(const std::array<double, kFeatureCount> &values)
      : values_(values) {}

  double get(Feature f) const { return values_[feature_index(f)]; }
  bool flag(Feature f) const { return values_[feature_index(f)] != 0.0; }

  std::array<double, kFeatureCount> values_;
};

#endif // FEATURE_RECORD_HPP
