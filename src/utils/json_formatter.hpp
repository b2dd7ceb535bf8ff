#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "models/feature_validator.hpp"
#include "models/prediction_result.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace JsonFormatter {

// {probability, riskCategory, contributions}
nlohmann::json prediction_to_json_object(const PredictionResult &result);

// One entry per issue: {path: [field], code, message}
nlohmann::json issues_to_json_array(const std::vector<ValidationIssue> &issues);

nlohmann::json error_to_json_object(const std::string &error);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
