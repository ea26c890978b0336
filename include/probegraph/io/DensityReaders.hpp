#pragma once

#include <string>
#include <string_view>

#include "probegraph/core/AtomicStructure.hpp"
#include "probegraph/core/ScalarField.hpp"

namespace probegraph::io {

// Bohr radius in Å (CODATA 2014).
inline constexpr double kBohr = 0.52917721067;

// A volumetric file as read from disk: values in e/Å³, lengths in Å.
struct DensityRecord {
  ScalarField field;
  AtomicStructure structure;
};

// Gaussian cube. Lengths are converted from Bohr (or kept in Å when a grid
// count is negative); values from e/Bohr³ to e/Å³. The structure is
// non-periodic and its cell spans the grid.
DensityRecord read_cube(std::string_view text, const std::string& source = "cube");

// VASP 5 CHGCAR/CHG/PARCHG. For files holding several images (CHG written
// during MD) the last image is returned. Only the total density is kept,
// divided by the cell volume; origin is zero and the structure is periodic.
DensityRecord read_chgcar(std::string_view text, const std::string& source = "CHGCAR");

// Atomic number of an element symbol ("Fe", "Fe_pv" and "Fe/..." accepted).
int atomic_number(std::string_view symbol);

} // namespace probegraph::io
