#include "gridatlas/Representatives.hpp"

#include "gridatlas/Parallel.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <sstream>

namespace gridatlas {

namespace {

// Half the Euclidean distance. Halving first and hypot keep it finite for any
// finite coordinates; only the ordering matters to callers.
inline double HalfDistance(double ax, double ay, double bx, double by)
{
  return std::hypot(0.5 * ax - 0.5 * bx, 0.5 * ay - 0.5 * by);
}

inline double Midpoint(double a, double b) { return 0.5 * a + 0.5 * b; }

// Member of `candidates` closest to (cx, cy), ties by the tie-break rule.
int ClosestTo(const std::vector<Item>& items, const std::vector<int>& candidates, double cx, double cy,
              TieBreak tieBreak)
{
  int best = -1;
  double bestD = std::numeric_limits<double>::infinity();
  for (int idx : candidates) {
    const Item& it = items[static_cast<std::size_t>(idx)];
    const double d = HalfDistance(it.x, it.y, cx, cy);
    if (best < 0 || d < bestD || (d == bestD && TieBreakLess(items, tieBreak, idx, best))) {
      best = idx;
      bestD = d;
    }
  }
  return best;
}

int SelectCenter(const std::vector<Item>& items, const Bounds& bounds, int resolution, const GridCell& cell,
                 TieBreak tieBreak)
{
  const Bounds cb = CellBoundsFor(bounds, resolution, cell.cell);
  const double cx = Midpoint(cb.minX, cb.maxX);
  const double cy = Midpoint(cb.minY, cb.maxY);
  return ClosestTo(items, cell.items, cx, cy, tieBreak);
}

int SelectDensestSubcell(const std::vector<Item>& items, const Bounds& bounds, int resolution,
                         const GridCell& cell, const SelectionConfig& cfg)
{
  if (static_cast<int>(cell.items.size()) <= cfg.denseCellThreshold) {
    return SelectCenter(items, bounds, resolution, cell, cfg.tieBreak);
  }

  const int s = std::max(1, cfg.subGridSize);
  const Bounds cb = CellBoundsFor(bounds, resolution, cell.cell);

  std::vector<std::vector<int>> mini(static_cast<std::size_t>(s) * static_cast<std::size_t>(s));
  for (int idx : cell.items) {
    const Item& it = items[static_cast<std::size_t>(idx)];
    const CellCoord m = CellIndexForCoordinate(cb, s, it.x, it.y);
    mini[static_cast<std::size_t>(m.row) * static_cast<std::size_t>(s) + static_cast<std::size_t>(m.col)]
        .push_back(idx);
  }

  // Densest mini cell; ties go to the lowest row-major index.
  std::size_t densest = 0;
  for (std::size_t k = 1; k < mini.size(); ++k) {
    if (mini[k].size() > mini[densest].size()) densest = k;
  }

  CellCoord m;
  m.col = static_cast<int>(densest % static_cast<std::size_t>(s));
  m.row = static_cast<int>(densest / static_cast<std::size_t>(s));
  const Bounds mb = CellBoundsFor(cb, s, m);
  return ClosestTo(items, mini[densest], Midpoint(mb.minX, mb.maxX), Midpoint(mb.minY, mb.maxY), cfg.tieBreak);
}

std::vector<int> NearestExamples(const std::vector<Item>& items, const GridCell& cell, int rep,
                                 const SelectionConfig& cfg)
{
  const int limit = std::min(cfg.examplesPerCell, static_cast<int>(cell.items.size()));
  if (limit <= 0 || rep < 0) return {};

  const Item& r = items[static_cast<std::size_t>(rep)];
  std::vector<int> order = cell.items;
  auto closer = [&](int a, int b) {
    const Item& ia = items[static_cast<std::size_t>(a)];
    const Item& ib = items[static_cast<std::size_t>(b)];
    const double da = HalfDistance(ia.x, ia.y, r.x, r.y);
    const double db = HalfDistance(ib.x, ib.y, r.x, r.y);
    if (da != db) return da < db;
    return TieBreakLess(items, cfg.tieBreak, a, b);
  };

  if (limit < static_cast<int>(order.size())) {
    std::partial_sort(order.begin(), order.begin() + limit, order.end(), closer);
    order.resize(static_cast<std::size_t>(limit));
  } else {
    std::sort(order.begin(), order.end(), closer);
  }
  return order;
}

RepresentativeLevel SelectIndependentLevel(const std::vector<Item>& items, const Bounds& bounds,
                                           const GridLevel& level, const SelectionConfig& cfg)
{
  RepresentativeLevel out;
  out.resolution = level.resolution;
  out.reps.reserve(level.cells.size());

  for (const GridCell& cell : level.cells) {
    CellRepresentative rep;
    rep.cell = cell.cell;
    rep.count = static_cast<int>(cell.items.size());
    if (cfg.policy == SelectionPolicy::DensestSubcell) {
      rep.item = SelectDensestSubcell(items, bounds, level.resolution, cell, cfg);
    } else {
      rep.item = SelectCenter(items, bounds, level.resolution, cell, cfg.tieBreak);
    }
    rep.examples = NearestExamples(items, cell, rep.item, cfg);
    out.reps.push_back(std::move(rep));
  }
  return out;
}

// Coarse level from the next finer one: each coarse cell reuses the
// representative of its most populated child (ties: row-major first).
RepresentativeLevel SelectFromChildren(const std::vector<Item>& items, const GridLevel& coarse,
                                       const GridLevel& fine, const RepresentativeLevel& fineReps,
                                       const SelectionConfig& cfg)
{
  RepresentativeLevel out;
  out.resolution = coarse.resolution;
  out.reps.resize(coarse.cells.size());

  std::vector<int> bestChild(coarse.cells.size(), -1);
  for (std::size_t k = 0; k < fine.cells.size(); ++k) {
    const CellCoord parent = ParentCell(fine.resolution, coarse.resolution, fine.cells[k].cell);
    const int p = FindCellIndex(coarse, parent);
    if (p < 0) continue;

    int& best = bestChild[static_cast<std::size_t>(p)];
    // Fine cells are visited in row-major order, so strict > keeps the first.
    if (best < 0 || fineReps.reps[k].count > fineReps.reps[static_cast<std::size_t>(best)].count) {
      best = static_cast<int>(k);
    }
  }

  for (std::size_t p = 0; p < coarse.cells.size(); ++p) {
    CellRepresentative& rep = out.reps[p];
    rep.cell = coarse.cells[p].cell;
    rep.count = static_cast<int>(coarse.cells[p].items.size());
    const int child = bestChild[p];
    rep.item = (child >= 0) ? fineReps.reps[static_cast<std::size_t>(child)].item : -1;
    rep.examples = NearestExamples(items, coarse.cells[p], rep.item, cfg);
  }
  return out;
}

} // namespace

bool TieBreakLess(const std::vector<Item>& items, TieBreak tieBreak, int a, int b)
{
  if (tieBreak == TieBreak::LowestId) {
    const std::string& ia = items[static_cast<std::size_t>(a)].id;
    const std::string& ib = items[static_cast<std::size_t>(b)].id;
    if (ia != ib) return ia < ib;
  }
  return a < b;
}

std::vector<RepresentativeLevel> SelectRepresentatives(const std::vector<Item>& items,
                                                       const GridHierarchy& hierarchy,
                                                       const SelectionConfig& cfg,
                                                       int threads)
{
  const int levelCount = static_cast<int>(hierarchy.levels.size());
  std::vector<RepresentativeLevel> out(static_cast<std::size_t>(levelCount));
  if (levelCount == 0) return out;

  if (cfg.policy != SelectionPolicy::ChildMaxCount) {
    ParallelForIndex(levelCount, threads, [&](int li) {
      out[static_cast<std::size_t>(li)] =
          SelectIndependentLevel(items, hierarchy.bounds, hierarchy.levels[static_cast<std::size_t>(li)], cfg);
    });
  } else {
    // Finest level picks by center, every coarser level derives from the level below.
    SelectionConfig leafCfg = cfg;
    leafCfg.policy = SelectionPolicy::Center;
    const std::size_t last = static_cast<std::size_t>(levelCount - 1);
    out[last] = SelectIndependentLevel(items, hierarchy.bounds, hierarchy.levels[last], leafCfg);

    for (int li = levelCount - 2; li >= 0; --li) {
      const std::size_t c = static_cast<std::size_t>(li);
      out[c] = SelectFromChildren(items, hierarchy.levels[c], hierarchy.levels[c + 1], out[c + 1], cfg);
    }
  }

  const GridLevel& finest = hierarchy.levels.back();
  for (RepresentativeLevel& level : out) {
    level.leafResolution = finest.resolution;
    for (CellRepresentative& rep : level.reps) {
      if (rep.item < 0) continue;
      const int slot = finest.itemCell[static_cast<std::size_t>(rep.item)];
      if (slot >= 0) rep.leaf = finest.cells[static_cast<std::size_t>(slot)].cell;
    }
  }
  return out;
}

bool CheckRepresentativeInvariants(const GridHierarchy& hierarchy,
                                   const std::vector<RepresentativeLevel>& levels,
                                   std::string& outWhy)
{
  outWhy.clear();
  auto failAt = [&](int resolution, const CellCoord& cell, int item, const char* what) {
    std::ostringstream oss;
    oss << what << " (resolution=" << resolution << ", cell=" << CellKey(cell) << ", item=" << item << ")";
    outWhy = oss.str();
    return false;
  };

  if (levels.size() != hierarchy.levels.size()) {
    outWhy = "representative level count does not match grid level count";
    return false;
  }

  for (std::size_t li = 0; li < hierarchy.levels.size(); ++li) {
    const GridLevel& gl = hierarchy.levels[li];
    const RepresentativeLevel& rl = levels[li];

    if (rl.resolution != gl.resolution || rl.reps.size() != gl.cells.size()) {
      outWhy = "representative level " + std::to_string(gl.resolution) + " does not match its grid level";
      return false;
    }

    // Partition: every item in exactly one cell, and itemCell agrees.
    std::vector<int> seen(static_cast<std::size_t>(hierarchy.itemCount), 0);
    for (std::size_t k = 0; k < gl.cells.size(); ++k) {
      for (int idx : gl.cells[k].items) {
        if (idx < 0 || idx >= hierarchy.itemCount) return failAt(gl.resolution, gl.cells[k].cell, idx, "bad index");
        if (++seen[static_cast<std::size_t>(idx)] > 1) {
          return failAt(gl.resolution, gl.cells[k].cell, idx, "item appears in more than one cell");
        }
        if (gl.itemCell[static_cast<std::size_t>(idx)] != static_cast<int>(k)) {
          return failAt(gl.resolution, gl.cells[k].cell, idx, "itemCell disagrees with cell membership");
        }
      }
    }
    for (int i = 0; i < hierarchy.itemCount; ++i) {
      if (seen[static_cast<std::size_t>(i)] != 1) return failAt(gl.resolution, CellCoord{}, i, "item not in any cell");
    }

    // Membership.
    for (std::size_t k = 0; k < gl.cells.size(); ++k) {
      const GridCell& cell = gl.cells[k];
      const CellRepresentative& rep = rl.reps[k];
      if (rep.cell != cell.cell || rep.count != static_cast<int>(cell.items.size())) {
        return failAt(gl.resolution, cell.cell, rep.item, "representative does not match its cell");
      }
      if (!std::binary_search(cell.items.begin(), cell.items.end(), rep.item)) {
        return failAt(gl.resolution, cell.cell, rep.item, "representative is not a member of its cell");
      }
      for (int ex : rep.examples) {
        if (!std::binary_search(cell.items.begin(), cell.items.end(), ex)) {
          return failAt(gl.resolution, cell.cell, ex, "example is not a member of its cell");
        }
      }
    }

    // Hierarchy: the representative lies in a populated child cell.
    if (li + 1 < hierarchy.levels.size()) {
      const GridLevel& fine = hierarchy.levels[li + 1];
      for (std::size_t k = 0; k < gl.cells.size(); ++k) {
        const int item = rl.reps[k].item;
        const int childIdx = fine.itemCell[static_cast<std::size_t>(item)];
        if (childIdx < 0 || static_cast<std::size_t>(childIdx) >= fine.cells.size()) {
          return failAt(gl.resolution, gl.cells[k].cell, item, "representative has no child cell");
        }
        const CellCoord child = fine.cells[static_cast<std::size_t>(childIdx)].cell;
        if (ParentCell(fine.resolution, gl.resolution, child) != gl.cells[k].cell) {
          return failAt(gl.resolution, gl.cells[k].cell, item, "representative lies outside the cell's subtree");
        }
      }
    }
  }

  return true;
}

} // namespace gridatlas
