#pragma once

#include "pipeaudit/checks/check_context.h"

#include <cstddef>

namespace pipeaudit::checks {

// PairEvaluation holds the three independent sub-conditions of a pair schema.
struct PairEvaluation {
  std::size_t vector_length{0};
  bool vector_ok{false};
  bool alignment_ok{false};
  bool indicators_ok{false};

  [[nodiscard]] bool passed() const { return vector_ok && alignment_ok && indicators_ok; }
};

// evaluate_pair_schema checks the primary document of a pair:
//   (a) the vector field is an array of exactly schema.vector_length elements,
//   (b) the alignment block is an object holding every alignment field,
//   (c) the indicator block is an object holding every indicator field.
[[nodiscard]] PairEvaluation evaluate_pair_schema(const nlohmann::json& primary,
                                                  const audit::PairSchema& schema);

// check_paired_artifact requires both files of the pair. Either one absent yields a single
// "missing A or B" WARN and the content is not inspected. This check never emits ERROR.
[[nodiscard]] CheckOutcome check_paired_artifact(const CheckContext& ctx,
                                                 const audit::Resource& resource);

}  // namespace pipeaudit::checks
