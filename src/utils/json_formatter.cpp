#include "json_formatter.hpp"

nlohmann::json
JsonFormatter::prediction_to_json_object(const PredictionResult &result) {
  nlohmann::json j;
  j["probability"] = result.probability;
  j["riskCategory"] = risk_category_to_string(result.risk_category);

  nlohmann::json j_contributions = nlohmann::json::object();
  for (const auto &kv : result.contributions)
    j_contributions[kv.first] = kv.second;
  j["contributions"] = j_contributions;

  return j;
}

nlohmann::json JsonFormatter::issues_to_json_array(
    const std::vector<ValidationIssue> &issues) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &issue : issues) {
    nlohmann::json j_path = nlohmann::json::array();
    if (!issue.path.empty())
      j_path.push_back(issue.path);

    j.push_back({{"path", j_path},
                 {"code", issue_code_to_string(issue.code)},
                 {"message", issue.message}});
  }
  return j;
}

nlohmann::json JsonFormatter::error_to_json_object(const std::string &error) {
  return {{"error", error}};
}

