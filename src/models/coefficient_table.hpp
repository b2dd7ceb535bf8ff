#ifndef COEFFICIENT_TABLE_HPP
#define COEFFICIENT_TABLE_HPP

#include "models/features.hpp"

#include <array>
#include <memory>
#include <string>
#include <vector>

enum class TermTransform { LINEAR, LOG1P };

const char *term_transform_to_string(TermTransform transform);

// One weighted term of the linear predictor. The raw feature value is
// encoded as (transform(raw) - center) / scale before weighting.
struct CoefficientTerm {
  double weight = 0.0;
  TermTransform transform = TermTransform::LINEAR;
  double center = 0.0;
  double scale = 1.0;

  double encode(double raw_value) const;
};

struct CoefficientTable {
  std::string version;
  double intercept = 0.0;
  std::array<CoefficientTerm, kFeatureCount> terms{};

  const CoefficientTerm &term(Feature f) const {
    return terms[feature_index(f)];
  }

  // The bundled demonstration table. Its weights are illustrative and have
  // not been clinically validated.
  static CoefficientTable builtin();
};

// Largest |z| a table may reach over the feature domain. Past this the
// sigmoid rounds to within a few ulps of 1 and logit(p) no longer recovers z
// to 1e-9 relative precision.
constexpr double kMaxAbsLinearPredictor = 18.0;

struct LinearPredictorRange {
  double min = 0.0;
  double max = 0.0;
};

// Smallest and largest z over every record the validator accepts. Each term is
// monotonic in its feature, so the extremes sit at the schema bounds.
LinearPredictorRange reachable_linear_predictor(const CoefficientTable &table);

bool validate_coefficient_table(const CoefficientTable &table,
                                std::vector<std::string> &errors);

// Reads a table from a JSON file. Throws std::runtime_error if the file is
// unreadable, malformed or fails validation.
std::shared_ptr<const CoefficientTable>
load_coefficient_table(const std::string &path);

// Parses the JSON text of a coefficient file; same failure semantics as
// load_coefficient_table.
std::shared_ptr<const CoefficientTable>
parse_coefficient_table(const std::string &json_text);

#endif // COEFFICIENT_TABLE_HPP
