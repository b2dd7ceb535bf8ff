#include "models/risk_category.hpp"

const char *risk_category_to_string(RiskCategory category) {
  switch (category) {
  case RiskCategory::LOW:
    return "Low";
  case RiskCategory::INTERMEDIATE:
    return "Intermediate";
  case RiskCategory::HIGH:
    return "High";
  }
  return "Unknown";
}

RiskCategory RiskThresholds::classify(double probability) const {
  if (probability < low)
    return RiskCategory::LOW;
  if (probability < high)
    return RiskCategory::INTERMEDIATE;
  return RiskCategory::HIGH;
}
