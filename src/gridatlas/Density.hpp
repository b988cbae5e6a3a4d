#pragma once

#include "gridatlas/Config.hpp"
#include "gridatlas/SpatialGrid.hpp"

#include <vector>

namespace gridatlas {

// Per-cell and per-item density scores in [0,1].
//
// Occupancy at a reference resolution is normalized by one of three methods:
//   Linear     c / max
//   Log        log1p(c) / log1p(max)
//   Percentile min(c, clip) / clip, clip = nearest-rank percentile of the
//              populated cell counts
// Every method is non-decreasing in c, and the densest cell scores 1.0
// (for Percentile: every cell at or above the clip).

struct DensityNormalizer {
  DensityMethod method = DensityMethod::Log;
  int maxCount = 0;
  int clipCount = 0;

  double score(int count) const;
};

// Nearest-rank percentile of the counts (p in (0,1]). Returns 0 for no counts.
int PercentileCount(std::vector<int> counts, double p);

// Normalizer for one grid level's populated cell counts.
DensityNormalizer MakeDensityNormalizer(const GridLevel& level, const DensityConfig& cfg);

// Scores parallel to level.cells.
std::vector<double> ComputeCellDensity(const GridLevel& level, const DensityConfig& cfg);

struct DensityResult {
  // Resolution the scores were computed at (0 when the hierarchy is empty).
  int resolution = 0;

  int maxCount = 0;
  int clipCount = 0;

  // Per item, parallel to the input items.
  std::vector<double> scores;
};

// Item scores from occupancy at `referenceResolution` (0 = finest level).
// Returns false if the resolution is not part of the hierarchy.
bool ComputeItemDensity(const GridHierarchy& hierarchy, const DensityConfig& cfg, DensityResult& out,
                        AtlasError& err);

} // namespace gridatlas
