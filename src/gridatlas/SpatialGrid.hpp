#pragma once

#include "gridatlas/Error.hpp"
#include "gridatlas/Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gridatlas {

// -----------------------------------------------------------------------------
// Spatial grid index
//
// Partitions the bounding box into N x N equal cells for every configured
// resolution and assigns each item to exactly one cell per resolution.
//
// Binning uses half-open intervals [min + i*w, min + (i+1)*w); items on the
// upper bound are clamped into the last cell. A zero-extent axis maps every
// item to index 0 on that axis.
//
// Items are binned once at the finest resolution; coarser indices are derived
// by integer division with the refinement ratio. Floating point rounding can
// therefore never place an item in a coarse cell that does not contain its
// fine cell.
// -----------------------------------------------------------------------------

struct GridCell {
  CellCoord cell{};

  // Indices into the item array, ascending.
  std::vector<int> items;
};

struct GridLevel {
  int resolution = 0;

  // Populated cells only, in row-major order.
  std::vector<GridCell> cells;

  // For every item: index into `cells`.
  std::vector<int> itemCell;
};

struct GridHierarchy {
  Bounds bounds{};

  // Levels ordered coarse -> fine.
  std::vector<GridLevel> levels;

  int itemCount = 0;

  const GridLevel* findLevel(int resolution) const;
  const GridLevel* finest() const { return levels.empty() ? nullptr : &levels.back(); }
};

// Tight bounding box of all coordinates, padded by `margin` times the extent on
// each side. Empty input yields an all-zero box.
Bounds ComputeBounds(const std::vector<Item>& items, double margin);

// Cell index of one coordinate at one resolution (clamped into the grid).
CellCoord CellIndexForCoordinate(const Bounds& bounds, int resolution, double x, double y);

// Geometric extent of one cell.
Bounds CellBoundsFor(const Bounds& bounds, int resolution, const CellCoord& cell);

// Bin all items at every resolution. `resolutions` need not be sorted but must
// each divide the largest (see ValidateAtlasConfig).
//
// Degenerate input (no items, or a bounding box of zero area) is reported as
// a warning; the result is still a valid (possibly empty) hierarchy.
GridHierarchy BuildGridHierarchy(const std::vector<Item>& items, const Bounds& bounds,
                                 const std::vector<int>& resolutions,
                                 std::vector<AtlasWarning>* outWarnings = nullptr);

// Binary search for a populated cell. Returns the index into level.cells or -1.
int FindCellIndex(const GridLevel& level, const CellCoord& cell);

// Cells of the finer level covered by one coarse cell, as an inclusive
// [first, last] coordinate range.
struct CellRange {
  CellCoord first{};
  CellCoord last{};
};
CellRange ChildCellRange(int coarseResolution, int fineResolution, const CellCoord& coarse);

// Parent coordinate of a fine cell in a coarser (dividing) resolution.
CellCoord ParentCell(int fineResolution, int coarseResolution, const CellCoord& fine);

// Stable string key used by the exporters: "col,row".
std::string CellKey(const CellCoord& cell);

} // namespace gridatlas
