#include "models/feature_validator.hpp"
#include "core/logger.hpp"

#include <array>
#include <cmath>
#include <sstream>

using json = nlohmann::json;

const char *issue_code_to_string(IssueCode code) {
  switch (code) {
  case IssueCode::MISSING:
    return "missing";
  case IssueCode::WRONG_TYPE:
    return "wrong_type";
  case IssueCode::NOT_FINITE:
    return "not_finite";
  case IssueCode::NOT_INTEGER:
    return "not_integer";
  case IssueCode::OUT_OF_RANGE:
    return "out_of_range";
  case IssueCode::UNKNOWN_FIELD:
    return "unknown_field";
  case IssueCode::INVALID_ENVELOPE:
    return "invalid_envelope";
  }
  return "unknown";
}

namespace {

ValidationIssue make_issue(const std::string &path, IssueCode code,
                           const std::string &message) {
  return ValidationIssue{path, code, message};
}

} // namespace

std::optional<ValidationIssue>
FeatureValidator::check_field(const FeatureSpec &spec, const json &raw,
                              double &out_value) const {
  const std::string name = spec.name;

  auto it = raw.find(name);
  if (it == raw.end())
    return make_issue(name, IssueCode::MISSING, name + " is required");

  const json &value = *it;

  if (spec.kind == FeatureKind::BOOLEAN) {
    if (!value.is_boolean())
      return make_issue(name, IssueCode::WRONG_TYPE,
                        name + " must be a boolean, got " +
                            std::string(value.type_name()));
    out_value = value.get<bool>() ? 1.0 : 0.0;
    return std::nullopt;
  }

  // Numeric strings are not coerced
  if (!value.is_number())
    return make_issue(name, IssueCode::WRONG_TYPE,
                      name + " must be a number, got " +
                          std::string(value.type_name()));

  const double number = value.get<double>();
  if (!std::isfinite(number))
    return make_issue(name, IssueCode::NOT_FINITE,
                      name + " must be a finite number");

  if (spec.kind == FeatureKind::INTEGER && std::trunc(number) != number)
    return make_issue(name, IssueCode::NOT_INTEGER,
                      name + " must be an integer");

  if (number < spec.min || number > spec.max) {
    std::ostringstream oss;
    oss << name << " must be between " << spec.min << " and " << spec.max
        << ", got " << number;
    return make_issue(name, IssueCode::OUT_OF_RANGE, oss.str());
  }

  out_value = number;
  return std::nullopt;
}

ValidationResult FeatureValidator::validate(const json &raw) const {
  ValidationResult result;

  if (!raw.is_object()) {
    LOG(LogLevel::DEBUG, LogComponent::MODEL_VALIDATION,
        "Rejected input of type " << raw.type_name()
                                  << "; expected an object.");
    result.issues.push_back(make_issue("", IssueCode::INVALID_ENVELOPE,
                                       "Request body must be a JSON object"));
    return result;
  }

  std::array<double, kFeatureCount> values{};
  for (const auto &spec : feature_schema()) {
    auto issue = check_field(spec, raw, values[feature_index(spec.feature)]);
    if (issue)
      result.issues.push_back(std::move(*issue));
  }

  if (reject_unknown_fields_) {
    for (auto it = raw.begin(); it != raw.end(); ++it) {
      if (!feature_from_name(it.key()))
        result.issues.push_back(make_issue(it.key(), IssueCode::UNKNOWN_FIELD,
                                           "Unrecognized field " + it.key()));
    }
  }

  if (!result.issues.empty()) {
    LOG(LogLevel::DEBUG, LogComponent::MODEL_VALIDATION,
        "Validation failed with " << result.issues.size() << " issue(s); first: "
                                  << result.issues.front().message);
    return result;
  }

  result.record = FeatureRecord(values);
  LOG(LogLevel::TRACE, LogComponent::MODEL_VALIDATION,
      "Validated feature record.");
  return result;
}
