#include "models/coefficient_table.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

const char *term_transform_to_string(TermTransform transform) {
  switch (transform) {
  case TermTransform::LINEAR:
    return "linear";
  case TermTransform::LOG1P:
    return "log1p";
  }
  return "unknown";
}

double CoefficientTerm::encode(double raw_value) const {
  double t = transform == TermTransform::LOG1P ? std::log1p(raw_value)
                                               : raw_value;
  return (t - center) / scale;
}

CoefficientTable CoefficientTable::builtin() {
  CoefficientTable table;
  table.version = "stemi-logit-demo-1";
  table.intercept = -5.0;

  auto set = [&table](Feature f, double weight, TermTransform transform,
                      double center, double scale) {
    table.terms[feature_index(f)] = CoefficientTerm{weight, transform, center,
                                                    scale};
  };

  // Continuous features are centred on a typical presentation and scaled to
  // clinically meaningful steps (per decade, per 10 bpm, per 10 mmHg).
  set(Feature::AGE_YEARS, 0.25, TermTransform::LINEAR, 60.0, 10.0);
  set(Feature::MALE, 0.35, TermTransform::LINEAR, 0.0, 1.0);
  set(Feature::CHEST_PAIN_TYPICAL, 1.10, TermTransform::LINEAR, 0.0, 1.0);
  set(Feature::ST_ELEVATION_MM, 0.85, TermTransform::LINEAR, 0.0, 1.0);
  set(Feature::RECIPROCAL_CHANGES, 1.20, TermTransform::LINEAR, 0.0, 1.0);
  set(Feature::TROPONIN_NG_L, 0.45, TermTransform::LOG1P, 0.0, 1.0);
  set(Feature::HEART_RATE_BPM, 0.08, TermTransform::LINEAR, 80.0, 10.0);
  set(Feature::SYSTOLIC_BP, -0.06, TermTransform::LINEAR, 130.0, 10.0);
  set(Feature::SMOKER, 0.30, TermTransform::LINEAR, 0.0, 1.0);
  set(Feature::DIABETES, 0.25, TermTransform::LINEAR, 0.0, 1.0);

  return table;
}

LinearPredictorRange reachable_linear_predictor(const CoefficientTable &table) {
  LinearPredictorRange range{table.intercept, table.intercept};
  for (const auto &spec : feature_schema()) {
    const CoefficientTerm &term = table.term(spec.feature);
    const double at_min = term.weight * term.encode(spec.min);
    const double at_max = term.weight * term.encode(spec.max);
    range.min += std::min(at_min, at_max);
    range.max += std::max(at_min, at_max);
  }
  return range;
}

bool validate_coefficient_table(const CoefficientTable &table,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (table.version.empty()) {
    errors.push_back("Coefficient table version cannot be empty");
    valid = false;
  }

  if (!std::isfinite(table.intercept)) {
    errors.push_back("Coefficient table intercept must be finite");
    valid = false;
  }

  for (const auto &spec : feature_schema()) {
    const CoefficientTerm &term = table.term(spec.feature);
    const std::string name = spec.name;

    if (!std::isfinite(term.weight) || !std::isfinite(term.center) ||
        !std::isfinite(term.scale)) {
      errors.push_back("Coefficient term " + name +
                       " must have finite weight, center and scale");
      valid = false;
    }

    if (!(term.scale > 0.0)) {
      errors.push_back("Coefficient term " + name +
                       " must have a positive scale");
      valid = false;
    }

    if (term.transform == TermTransform::LOG1P && spec.min <= -1.0) {
      errors.push_back("Coefficient term " + name +
                       " cannot use log1p on a domain reaching -1");
      valid = false;
    }
  }

  // Only meaningful once every term is finite and well-formed
  if (valid) {
    LinearPredictorRange range = reachable_linear_predictor(table);
    if (!(std::abs(range.min) <= kMaxAbsLinearPredictor &&
          std::abs(range.max) <= kMaxAbsLinearPredictor)) {
      std::ostringstream oss;
      oss << "Coefficient table reaches linear predictor range [" << range.min
          << ", " << range.max << "], outside +/-" << kMaxAbsLinearPredictor;
      errors.push_back(oss.str());
      valid = false;
    }
  }

  return valid;
}

namespace {

std::optional<double> read_number(const json &obj, const char *key,
                                  const std::string &context,
                                  std::vector<std::string> &errors) {
  auto it = obj.find(key);
  if (it == obj.end())
    return std::nullopt;
  if (!it->is_number()) {
    errors.push_back(context + "." + key + " must be a number");
    return std::nullopt;
  }
  return it->get<double>();
}

std::string join_errors(const std::vector<std::string> &errors) {
  std::ostringstream oss;
  for (size_t i = 0; i < errors.size(); ++i) {
    if (i > 0)
      oss << "; ";
    oss << errors[i];
  }
  return oss.str();
}

} // namespace

std::shared_ptr<const CoefficientTable>
parse_coefficient_table(const std::string &json_text) {
  json data;
  try {
    data = json::parse(json_text);
  } catch (const json::parse_error &e) {
    throw std::runtime_error(std::string("Malformed coefficient file: ") +
                             e.what());
  }

  if (!data.is_object())
    throw std::runtime_error("Coefficient file must contain a JSON object");

  auto table = std::make_shared<CoefficientTable>();
  std::vector<std::string> errors;

  auto version_it = data.find("version");
  if (version_it == data.end() || !version_it->is_string())
    errors.push_back("version must be a string");
  else
    table->version = version_it->get<std::string>();

  if (data.find("intercept") == data.end())
    errors.push_back("intercept is required");
  else if (auto intercept = read_number(data, "intercept", "coefficients",
                                        errors))
    table->intercept = *intercept;

  auto terms_it = data.find("terms");
  if (terms_it == data.end() || !terms_it->is_object()) {
    errors.push_back("terms must be an object keyed by feature name");
  } else {
    std::array<bool, kFeatureCount> seen{};

    for (auto it = terms_it->begin(); it != terms_it->end(); ++it) {
      const std::string context = "terms." + it.key();
      auto feature = feature_from_name(it.key());
      if (!feature) {
        errors.push_back(context + " is not a known feature");
        continue;
      }
      if (!it->is_object()) {
        errors.push_back(context + " must be an object");
        continue;
      }

      CoefficientTerm term;
      if (it->find("weight") == it->end())
        errors.push_back(context + ".weight is required");
      else if (auto weight = read_number(*it, "weight", context, errors))
        term.weight = *weight;

      term.center = read_number(*it, "center", context, errors).value_or(0.0);
      term.scale = read_number(*it, "scale", context, errors).value_or(1.0);

      auto transform_it = it->find("transform");
      if (transform_it != it->end()) {
        const std::string transform =
            transform_it->is_string() ? transform_it->get<std::string>() : "";
        if (transform == "linear")
          term.transform = TermTransform::LINEAR;
        else if (transform == "log1p")
          term.transform = TermTransform::LOG1P;
        else
          errors.push_back(context +
                           ".transform must be \"linear\" or \"log1p\"");
      }

      table->terms[feature_index(*feature)] = term;
      seen[feature_index(*feature)] = true;
    }

    for (const auto &spec : feature_schema())
      if (!seen[feature_index(spec.feature)])
        errors.push_back(std::string("terms.") + spec.name + " is required");
  }

  if (errors.empty())
    validate_coefficient_table(*table, errors);

  if (!errors.empty())
    throw std::runtime_error("Invalid coefficient table: " +
                             join_errors(errors));

  return table;
}

std::shared_ptr<const CoefficientTable>
load_coefficient_table(const std::string &path) {
  LOG(LogLevel::INFO, LogComponent::MODEL_LIFECYCLE,
      "Loading coefficient table from: " << path);

  std::ifstream f(path);
  if (!f.is_open())
    throw std::runtime_error("Could not open coefficient file: " + path);

  std::stringstream buffer;
  buffer << f.rdbuf();
  auto table = parse_coefficient_table(buffer.str());

  LOG(LogLevel::INFO, LogComponent::MODEL_LIFECYCLE,
      "Loaded coefficient table version " << table->version);
  return table;
}
