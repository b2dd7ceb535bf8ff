#ifndef STEMI_MODEL_HPP
#define STEMI_MODEL_HPP

#include "models/base_model.hpp"
#include "models/coefficient_table.hpp"
#include "models/risk_category.hpp"

#include <memory>

// Numerically stable logistic function; the result lies in (0, 1) for every
// finite z that does not saturate double precision.
double sigmoid(double z);

// Inverse of sigmoid, for p in (0, 1).
double logit(double p);

// Logistic STEMI risk model. Stateless after construction; predict() may be
// called concurrently from any number of threads.
class StemiModel : public IRiskModel {
public:
  StemiModel(std::shared_ptr<const CoefficientTable> coefficients,
             RiskThresholds thresholds);

  PredictionResult predict(const FeatureRecord &features) const override;

  const CoefficientTable &coefficients() const { return *coefficients_; }
  const RiskThresholds &thresholds() const { return thresholds_; }

private:
  std::shared_ptr<const CoefficientTable> coefficients_;
  RiskThresholds thresholds_;
};

#endif // STEMI_MODEL_HPP
