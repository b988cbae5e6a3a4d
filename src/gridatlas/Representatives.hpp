#pragma once

#include "gridatlas/Config.hpp"
#include "gridatlas/SpatialGrid.hpp"
#include "gridatlas/Types.hpp"

#include <string>
#include <vector>

namespace gridatlas {

// -----------------------------------------------------------------------------
// Representative selection
//
// Every populated cell at every resolution gets exactly one representative
// item, chosen by a deterministic and total order (policy distance first, then
// the configured tie-break). Results never depend on thread scheduling.
//
// Cross-level consistency (a coarse cell's representative lies in one of its
// populated children) follows from the nested partition for the independent
// policies and is enforced procedurally by ChildMaxCount.
// CheckRepresentativeInvariants verifies it either way.
// -----------------------------------------------------------------------------

struct CellRepresentative {
  CellCoord cell{};

  // Number of items in the cell.
  int count = 0;

  // Index into the item array.
  int item = -1;

  // Cell of `item` at the finest resolution.
  CellCoord leaf{};

  // Up to examplesPerCell cell members, nearest to the representative first.
  std::vector<int> examples;
};

struct RepresentativeLevel {
  int resolution = 0;

  // Resolution of CellRepresentative::leaf; 0 when leaves were not filled in.
  int leafResolution = 0;

  // Parallel to GridLevel::cells (row-major, populated cells only).
  std::vector<CellRepresentative> reps;
};

// Levels are returned in the same (coarse -> fine) order as hierarchy.levels.
std::vector<RepresentativeLevel> SelectRepresentatives(const std::vector<Item>& items,
                                                       const GridHierarchy& hierarchy,
                                                       const SelectionConfig& cfg,
                                                       int threads = 1);

// True when candidate `a` should win over `b` at equal policy distance.
bool TieBreakLess(const std::vector<Item>& items, TieBreak tieBreak, int a, int b);

// Verify partition, membership and hierarchy-consistency invariants.
// On failure, outWhy names the resolution, cell and item involved.
bool CheckRepresentativeInvariants(const GridHierarchy& hierarchy,
                                   const std::vector<RepresentativeLevel>& levels,
                                   std::string& outWhy);

} // namespace gridatlas
