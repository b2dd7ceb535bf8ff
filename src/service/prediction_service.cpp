#include "service/prediction_service.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/json_formatter.hpp"

#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace {

struct ServiceMetrics {
  prometheus::Family<prometheus::Counter> &predictions;
  prometheus::Counter &validation_failures;
  prometheus::Counter &bad_requests;
  prometheus::Counter &internal_errors;
};

ServiceMetrics &service_metrics() {
  auto &registry = MetricsRegistry::instance();
  static ServiceMetrics metrics{
      registry.create_counter_family(
          "stemi_predictions_total",
          "Successful predictions, labelled by risk category."),
      registry.create_counter("stemi_validation_failures_total",
                              "Requests rejected for schema violations."),
      registry.create_counter("stemi_bad_requests_total",
                              "Requests whose body was not a JSON object."),
      registry.create_counter("stemi_internal_errors_total",
                              "Requests that hit a model invariant "
                              "violation.")};
  return metrics;
}

ServiceResponse bad_request() {
  service_metrics().bad_requests.Increment();
  return {400, JsonFormatter::error_to_json_object("Bad request")};
}

} // namespace

PredictionService::PredictionService(std::shared_ptr<const IRiskModel> model,
                                     FeatureValidator validator)
    : model_(std::move(model)), validator_(validator) {
  if (!model_)
    throw std::invalid_argument("PredictionService requires a model");
}

ServiceResponse PredictionService::handle_predict(const std::string &body) const {
  json raw = json::parse(body, nullptr, false);
  if (raw.is_discarded()) {
    LOG(LogLevel::DEBUG, LogComponent::SERVICE,
        "Rejected request: body is not valid JSON.");
    return bad_request();
  }
  return handle_predict_json(raw);
}

ServiceResponse PredictionService::handle_predict_json(const json &raw) const {
  ValidationResult validation = validator_.validate(raw);

  if (validation.is_envelope_error())
    return bad_request();

  if (!validation.ok()) {
    service_metrics().validation_failures.Increment();
    LOG(LogLevel::INFO, LogComponent::SERVICE,
        "Rejected request with " << validation.issues.size()
                                 << " validation issue(s).");
    json body = JsonFormatter::error_to_json_object("Invalid input");
    body["issues"] = JsonFormatter::issues_to_json_array(validation.issues);
    return {400, body};
  }

  try {
    PredictionResult result = model_->predict(*validation.record);
    service_metrics()
        .predictions
        .Add({{"risk_category", risk_category_to_string(result.risk_category)}})
        .Increment();
    return {200, JsonFormatter::prediction_to_json_object(result)};
  } catch (const std::logic_error &e) {
    service_metrics().internal_errors.Increment();
    LOG(LogLevel::FATAL, LogComponent::SERVICE,
        "Model invariant violated: " << e.what());
    return {500, JsonFormatter::error_to_json_object("Internal error")};
  }
}
