#ifndef PREDICTION_SERVICE_HPP
#define PREDICTION_SERVICE_HPP

#include "models/base_model.hpp"
#include "models/feature_validator.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

struct ServiceResponse {
  int status = 200;
  nlohmann::json body;
};

// Transport-independent handler for prediction requests: validation first,
// scoring only for valid input. Safe to call concurrently.
class PredictionService {
public:
  PredictionService(std::shared_ptr<const IRiskModel> model,
                    FeatureValidator validator);

  // Body is the raw request text. Unparseable JSON and non-object bodies
  // yield 400 "Bad request"; schema violations yield 400 "Invalid input"
  // with every issue listed.
  ServiceResponse handle_predict(const std::string &body) const;

  ServiceResponse handle_predict_json(const nlohmann::json &raw) const;

private:
  std::shared_ptr<const IRiskModel> model_;
  FeatureValidator validator_;
};

#endif // PREDICTION_SERVICE_HPP
