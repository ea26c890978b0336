#include "probegraph/neighbor/NeighborIndex.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "probegraph/neighbor/CellListIndex.hpp"
#include "probegraph/neighbor/PrimitiveIndex.hpp"

namespace probegraph::neighbor {

std::unique_ptr<NeighborIndex> build_neighbor_index(const AtomicStructure& structure, double cutoff) {
  return build_neighbor_index(structure, cutoff, [](const AtomicStructure& s, double rc) {
    return std::unique_ptr<NeighborIndex>(std::make_unique<CellListIndex>(s, rc));
  });
}

std::unique_ptr<NeighborIndex> build_neighbor_index(const AtomicStructure& structure, double cutoff,
                                                    const IndexFactory& fast) {
  if (needs_fallback_index(structure, cutoff)) {
    return std::make_unique<PrimitiveIndex>(structure, cutoff);
  }
  try {
    if (auto index = fast(structure, cutoff)) return index;
    throw std::runtime_error("fast index factory returned null");
  } catch (const std::invalid_argument&) {
    throw;
  } catch (const std::exception& e) {
    std::cerr << "[probegraph] warning: fast neighbor index failed (" << e.what()
              << "); using primitive neighbor list, this might get slow\n";
  }
  return std::make_unique<PrimitiveIndex>(structure, cutoff);
}

} // namespace probegraph::neighbor
