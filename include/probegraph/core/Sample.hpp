#pragma once

#include <string>
#include <utility>

#include "probegraph/core/AtomicStructure.hpp"
#include "probegraph/core/ScalarField.hpp"

namespace probegraph {

struct SampleMetadata {
  std::string source_name;
};

// One dataset item: the field, its structure and the precomputed grid positions.
struct Sample {
  ScalarField field;
  AtomicStructure structure;
  Vec3 origin{0.0, 0.0, 0.0};
  GridPositions grid_positions;
  SampleMetadata metadata;
};

inline Sample make_sample(ScalarField field, AtomicStructure structure, std::string source_name) {
  field.validate();
  structure.validate();
  Sample s;
  s.origin = field.origin;
  s.grid_positions = calculate_grid_positions(field);
  s.field = std::move(field);
  s.structure = std::move(structure);
  s.metadata.source_name = std::move(source_name);
  return s;
}

} // namespace probegraph
