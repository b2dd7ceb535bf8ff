#include "models/prediction_result.hpp"

#include <algorithm>
#include <cmath>

std::vector<std::pair<std::string, double>>
PredictionResult::top_contributors(std::size_t n) const {
  std::vector<std::pair<std::string, double>> terms;
  terms.reserve(contributions.size());
  for (const auto &kv : contributions)
    if (kv.first != kInterceptTerm)
      terms.push_back(kv);

  std::stable_sort(terms.begin(), terms.end(),
                   [](const auto &a, const auto &b) {
                     return std::abs(a.second) > std::abs(b.second);
                   });

  if (terms.size() > n)
    terms.resize(n);
  return terms;
}
