#ifndef RISK_CATEGORY_HPP
#define RISK_CATEGORY_HPP

#include <string>

enum class RiskCategory { LOW, INTERMEDIATE, HIGH };

// "Low", "Intermediate" or "High"
const char *risk_category_to_string(RiskCategory category);

// Bands are closed below and open above: [0, low) is LOW, [low, high) is
// INTERMEDIATE, [high, 1] is HIGH. Requires 0 < low < high < 1.
struct RiskThresholds {
  double low = 0.15;
  double high = 0.50;

  RiskCategory classify(double probability) const;
};

#endif // RISK_CATEGORY_HPP
