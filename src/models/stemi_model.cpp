#include "models/stemi_model.hpp"
#include "core/logger.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

double sigmoid(double z) {
  if (z >= 0.0)
    return 1.0 / (1.0 + std::exp(-z));
  // e^z cannot overflow here
  const double ez = std::exp(z);
  return ez / (1.0 + ez);
}

double logit(double p) { return std::log(p) - std::log1p(-p); }

StemiModel::StemiModel(std::shared_ptr<const CoefficientTable> coefficients,
                       RiskThresholds thresholds)
    : coefficients_(std::move(coefficients)), thresholds_(thresholds) {
  if (!coefficients_)
    throw std::invalid_argument("StemiModel requires a coefficient table");

  std::vector<std::string> errors;
  if (!validate_coefficient_table(*coefficients_, errors))
    throw std::invalid_argument("StemiModel given an invalid coefficient "
                                "table: " +
                                errors.front());

  if (!(thresholds_.low > 0.0 && thresholds_.low < thresholds_.high &&
        thresholds_.high < 1.0))
    throw std::invalid_argument(
        "StemiModel risk thresholds must satisfy 0 < low < high < 1");

  LOG(LogLevel::INFO, LogComponent::MODEL_LIFECYCLE,
      "StemiModel ready with coefficients " << coefficients_->version
                                            << ", thresholds low="
                                            << thresholds_.low
                                            << " high=" << thresholds_.high);
}

PredictionResult StemiModel::predict(const FeatureRecord &features) const {
  PredictionResult result;
  result.coefficients_version = coefficients_->version;

  // z is accumulated from the very values stored as contributions, in a
  // fixed order, so the decomposition sums back to z exactly.
  double z = coefficients_->intercept;
  result.contributions[kInterceptTerm] = coefficients_->intercept;

  for (const auto &spec : feature_schema()) {
    const CoefficientTerm &term = coefficients_->term(spec.feature);
    const double contribution =
        term.weight * term.encode(features.encoded(spec.feature));
    result.contributions[spec.name] = contribution;
    z += contribution;
  }

  if (!std::isfinite(z)) {
    LOG(LogLevel::FATAL, LogComponent::MODEL_SCORING,
        "Non-finite linear predictor with coefficients "
            << coefficients_->version
            << "; the coefficient table is corrupt.");
    throw std::logic_error("Non-finite linear predictor");
  }

  result.linear_predictor = z;
  result.probability = sigmoid(z);
  result.risk_category = thresholds_.classify(result.probability);

  LOG(LogLevel::DEBUG, LogComponent::MODEL_SCORING,
      "Scored z=" << z << " p=" << result.probability << " category="
                  << risk_category_to_string(result.risk_category));
  return result;
}
