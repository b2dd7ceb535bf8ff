#ifndef FEATURES_HPP
#define FEATURES_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

enum class Feature {
  // --- Demographics ---
  AGE_YEARS,
  MALE,

  // --- Presentation and ECG ---
  CHEST_PAIN_TYPICAL,
  ST_ELEVATION_MM,
  RECIPROCAL_CHANGES,

  // --- Biomarkers and vitals ---
  TROPONIN_NG_L,
  HEART_RATE_BPM,
  SYSTOLIC_BP,

  // --- Risk factors ---
  SMOKER,
  DIABETES,

  // This must always be the last item. It automatically provides the total
  // count.
  FEATURE_COUNT
};

constexpr std::size_t kFeatureCount =
    static_cast<std::size_t>(Feature::FEATURE_COUNT);

enum class FeatureKind { INTEGER, REAL, BOOLEAN };

// Inclusive bounds; ignored for BOOLEAN features.
struct FeatureSpec {
  Feature feature;
  const char *name;
  FeatureKind kind;
  double min;
  double max;
};

// Canonical wire name, e.g. "ageYears".
std::string get_feature_name(Feature f);
std::optional<Feature> feature_from_name(std::string_view name);

const std::array<FeatureSpec, kFeatureCount> &feature_schema();
const FeatureSpec &feature_spec(Feature f);

inline std::size_t feature_index(Feature f) {
  return static_cast<std::size_t>(f);
}

#endif // FEATURES_HPP
