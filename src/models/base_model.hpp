#ifndef BASE_MODEL_HPP
#define BASE_MODEL_HPP

#include "models/feature_record.hpp"
#include "models/prediction_result.hpp"

// Abstract base class for risk models
class IRiskModel {
public:
  virtual ~IRiskModel() = default;

  // The primary scoring method. Returns the probability together with the
  // per-term contributions that explain it.
  virtual PredictionResult predict(const FeatureRecord &features) const = 0;

  // Helper method for cases where only the probability is needed.
  virtual double score(const FeatureRecord &features) const {
    return predict(features).probability;
  }
};

#endif // BASE_MODEL_HPP
