#include "gridatlas/SpatialGrid.hpp"

#include "gridatlas/Config.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <unordered_map>

namespace gridatlas {

namespace {

// Axis math works on half extents: 0.5 * max - 0.5 * min is finite for any
// pair of finite doubles while max - min can overflow.
inline double HalfExtent(double minV, double maxV) { return 0.5 * maxV - 0.5 * minV; }

inline int AxisIndex(double v, double minV, double maxV, int n)
{
  const double half = HalfExtent(minV, maxV);
  if (!(half > 0.0) || n <= 1) return 0;
  const double t = (0.5 * v - 0.5 * minV) / half * static_cast<double>(n);
  if (!(t > 0.0)) return 0; // also catches NaN
  if (t >= static_cast<double>(n)) return n - 1;
  const int i = static_cast<int>(std::floor(t));
  return std::clamp(i, 0, n - 1);
}

// Edge i of n equal steps from a to b; never leaves [a, b].
inline double AxisEdge(double a, double b, int i, int n)
{
  if (i <= 0) return a;
  if (i >= n) return b;
  const double t = static_cast<double>(i) / static_cast<double>(n);
  return a * (1.0 - t) + b * t;
}

inline std::uint64_t PackKey(const CellCoord& c, int resolution)
{
  return static_cast<std::uint64_t>(c.row) * static_cast<std::uint64_t>(resolution) +
         static_cast<std::uint64_t>(c.col);
}

GridLevel BinLevel(const std::vector<CellCoord>& fineCells, int fineResolution, int resolution,
                   const std::vector<Item>& items, const Bounds& bounds)
{
  GridLevel level;
  level.resolution = resolution;

  const std::size_t n = fineCells.size();
  level.itemCell.assign(n, -1);
  if (n == 0) return level;

  const bool nested = (fineResolution % resolution) == 0;
  const int ratio = nested ? fineResolution / resolution : 1;

  // Cell coordinate per item, then group with a hash map: O(n) expected.
  std::vector<CellCoord> coords(n);
  std::unordered_map<std::uint64_t, int> slotByKey;
  slotByKey.reserve(std::min<std::size_t>(n, static_cast<std::size_t>(resolution) * resolution));

  std::vector<GridCell> unsorted;
  for (std::size_t i = 0; i < n; ++i) {
    CellCoord c;
    if (nested) {
      c.col = fineCells[i].col / ratio;
      c.row = fineCells[i].row / ratio;
    } else {
      c = CellIndexForCoordinate(bounds, resolution, items[i].x, items[i].y);
    }
    coords[i] = c;

    const std::uint64_t key = PackKey(c, resolution);
    auto it = slotByKey.find(key);
    int slot = 0;
    if (it == slotByKey.end()) {
      slot = static_cast<int>(unsorted.size());
      slotByKey.emplace(key, slot);
      GridCell gc;
      gc.cell = c;
      unsorted.push_back(std::move(gc));
    } else {
      slot = it->second;
    }
    unsorted[static_cast<std::size_t>(slot)].items.push_back(static_cast<int>(i));
    level.itemCell[i] = slot;
  }

  // Row-major order of the populated cells; remap the per-item slots.
  std::vector<int> order(unsorted.size());
  for (std::size_t k = 0; k < order.size(); ++k) order[k] = static_cast<int>(k);
  std::sort(order.begin(), order.end(), [&](int a, int b) {
    return CellLess(unsorted[static_cast<std::size_t>(a)].cell, unsorted[static_cast<std::size_t>(b)].cell);
  });

  std::vector<int> remap(unsorted.size());
  level.cells.reserve(unsorted.size());
  for (std::size_t k = 0; k < order.size(); ++k) {
    remap[static_cast<std::size_t>(order[k])] = static_cast<int>(k);
    level.cells.push_back(std::move(unsorted[static_cast<std::size_t>(order[k])]));
  }
  for (int& slot : level.itemCell) slot = remap[static_cast<std::size_t>(slot)];

  return level;
}

} // namespace

const GridLevel* GridHierarchy::findLevel(int resolution) const
{
  for (const GridLevel& l : levels) {
    if (l.resolution == resolution) return &l;
  }
  return nullptr;
}

Bounds ComputeBounds(const std::vector<Item>& items, double margin)
{
  Bounds b;
  if (items.empty()) return b;

  b.minX = std::numeric_limits<double>::infinity();
  b.minY = std::numeric_limits<double>::infinity();
  b.maxX = -std::numeric_limits<double>::infinity();
  b.maxY = -std::numeric_limits<double>::infinity();

  for (const Item& it : items) {
    b.minX = std::min(b.minX, it.x);
    b.minY = std::min(b.minY, it.y);
    b.maxX = std::max(b.maxX, it.x);
    b.maxY = std::max(b.maxY, it.y);
  }

  if (margin > 0.0) {
    // May overflow to infinity; BuildAtlas rejects non-finite bounds.
    const double padX = HalfExtent(b.minX, b.maxX) * (2.0 * margin);
    const double padY = HalfExtent(b.minY, b.maxY) * (2.0 * margin);
    b.minX -= padX;
    b.maxX += padX;
    b.minY -= padY;
    b.maxY += padY;
  }
  return b;
}

CellCoord CellIndexForCoordinate(const Bounds& bounds, int resolution, double x, double y)
{
  CellCoord c;
  c.col = AxisIndex(x, bounds.minX, bounds.maxX, resolution);
  c.row = AxisIndex(y, bounds.minY, bounds.maxY, resolution);
  return c;
}

Bounds CellBoundsFor(const Bounds& bounds, int resolution, const CellCoord& cell)
{
  const int n = std::max(1, resolution);

  Bounds out;
  out.minX = AxisEdge(bounds.minX, bounds.maxX, cell.col, n);
  out.maxX = AxisEdge(bounds.minX, bounds.maxX, cell.col + 1, n);
  out.minY = AxisEdge(bounds.minY, bounds.maxY, cell.row, n);
  out.maxY = AxisEdge(bounds.minY, bounds.maxY, cell.row + 1, n);
  return out;
}

GridHierarchy BuildGridHierarchy(const std::vector<Item>& items, const Bounds& bounds,
                                 const std::vector<int>& resolutions, std::vector<AtlasWarning>* outWarnings)
{
  GridHierarchy h;
  h.bounds = bounds;
  h.itemCount = static_cast<int>(items.size());

  const std::vector<int> sorted = SortedResolutions(resolutions);
  if (sorted.empty() || sorted.front() <= 0) return h;

  if (outWarnings) {
    AtlasWarning w;
    w.kind = WarningKind::DegenerateInput;
    if (items.empty()) {
      w.message = "empty item set; every resolution is empty";
      outWarnings->push_back(w);
    } else if (!(bounds.width() > 0.0) && !(bounds.height() > 0.0)) {
      w.message = "all items share one coordinate; every resolution has a single populated cell";
      outWarnings->push_back(w);
    } else if (!(bounds.width() > 0.0) || !(bounds.height() > 0.0)) {
      w.message = std::string("zero extent on the ") + (bounds.width() > 0.0 ? "y" : "x") +
                  " axis; it is treated as a single cell";
      outWarnings->push_back(w);
    }
  }

  const int finest = sorted.back();
  std::vector<CellCoord> fineCells(items.size());
  for (std::size_t i = 0; i < items.size(); ++i) {
    fineCells[i] = CellIndexForCoordinate(bounds, finest, items[i].x, items[i].y);
  }

  h.levels.reserve(sorted.size());
  for (int r : sorted) {
    h.levels.push_back(BinLevel(fineCells, finest, r, items, bounds));
  }
  return h;
}

int FindCellIndex(const GridLevel& level, const CellCoord& cell)
{
  auto it = std::lower_bound(level.cells.begin(), level.cells.end(), cell,
                             [](const GridCell& gc, const CellCoord& c) { return CellLess(gc.cell, c); });
  if (it == level.cells.end() || it->cell != cell) return -1;
  return static_cast<int>(it - level.cells.begin());
}

CellRange ChildCellRange(int coarseResolution, int fineResolution, const CellCoord& coarse)
{
  const int ratio = (coarseResolution > 0) ? std::max(1, fineResolution / coarseResolution) : 1;
  CellRange r;
  r.first.col = coarse.col * ratio;
  r.first.row = coarse.row * ratio;
  r.last.col = r.first.col + ratio - 1;
  r.last.row = r.first.row + ratio - 1;
  return r;
}

CellCoord ParentCell(int fineResolution, int coarseResolution, const CellCoord& fine)
{
  const int ratio = (coarseResolution > 0) ? std::max(1, fineResolution / coarseResolution) : 1;
  CellCoord c;
  c.col = fine.col / ratio;
  c.row = fine.row / ratio;
  return c;
}

std::string CellKey(const CellCoord& cell)
{
  return std::to_string(cell.col) + "," + std::to_string(cell.row);
}

} // namespace gridatlas
