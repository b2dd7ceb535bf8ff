#ifndef FEATURE_VALIDATOR_HPP
#define FEATURE_VALIDATOR_HPP

#include "models/feature_record.hpp"
#include "models/features.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

enum class IssueCode {
  MISSING,
  WRONG_TYPE,
  NOT_FINITE,
  NOT_INTEGER,
  OUT_OF_RANGE,
  UNKNOWN_FIELD,
  INVALID_ENVELOPE
};

const char *issue_code_to_string(IssueCode code);

struct ValidationIssue {
  // Offending field name; empty when the input as a whole is unusable
  std::string path;
  IssueCode code;
  std::string message;
};

struct ValidationResult {
  std::optional<FeatureRecord> record;
  std::vector<ValidationIssue> issues;

  bool ok() const { return record.has_value(); }

  // True when the input was not an object at all, as opposed to an object
  // with bad fields.
  bool is_envelope_error() const {
    return !issues.empty() && issues.front().code == IssueCode::INVALID_ENVELOPE;
  }
};

class FeatureValidator {
public:
  explicit FeatureValidator(bool reject_unknown_fields = false)
      : reject_unknown_fields_(reject_unknown_fields) {}

  // Checks every canonical field and reports all problems at once. Never
  // throws and has no side effects besides logging.
  ValidationResult validate(const nlohmann::json &raw) const;

  bool rejects_unknown_fields() const { return reject_unknown_fields_; }

private:
  std::optional<ValidationIssue> check_field(const FeatureSpec &spec,
                                             const nlohmann::json &raw,
                                             double &out_value) const;

  bool reject_unknown_fields_;
};

#endif // FEATURE_VALIDATOR_HPP
