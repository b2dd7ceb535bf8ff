#ifndef PREDICTION_RESULT_HPP
#define PREDICTION_RESULT_HPP

#include "models/risk_category.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

// Reserved contribution key for the model's baseline log-odds
constexpr const char *kInterceptTerm = "intercept";

struct PredictionResult {
  double probability = 0.0;
  // Log-odds; equals the sum of all contributions
  double linear_predictor = 0.0;
  RiskCategory risk_category = RiskCategory::LOW;
  std::map<std::string, double> contributions;
  std::string coefficients_version;

  // Feature terms ordered by descending absolute contribution (ties by name),
  // intercept excluded.
  std::vector<std::pair<std::string, double>>
  top_contributors(std::size_t n) const;
};

#endif // PREDICTION_RESULT_HPP
