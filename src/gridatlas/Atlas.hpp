#pragma once

#include "gridatlas/Config.hpp"
#include "gridatlas/Density.hpp"
#include "gridatlas/Error.hpp"
#include "gridatlas/Export.hpp"
#include "gridatlas/Layout.hpp"
#include "gridatlas/Representatives.hpp"
#include "gridatlas/SpatialGrid.hpp"
#include "gridatlas/Types.hpp"

#include <string>
#include <vector>

namespace gridatlas {

// Everything computed for one item set under one configuration.
struct AtlasResult {
  Bounds bounds{};
  GridHierarchy hierarchy;

  // Parallel to hierarchy.levels.
  std::vector<RepresentativeLevel> representatives;
  std::vector<std::vector<double>> cellDensity;

  // Per-item density at the reference resolution.
  DensityResult density;

  std::vector<AtlasWarning> warnings;

  // Index into hierarchy.levels, or -1.
  int levelIndex(int resolution) const;
};

// Validate the configuration and the items, then bin, select representatives
// and compute density. Nothing is computed when validation fails.
bool BuildAtlas(const std::vector<Item>& items, const AtlasConfig& cfg, AtlasResult& out, AtlasError& err);

// Placement view of one resolution: one placement per populated cell, for
// its representative, sized by the cell's own density.
bool BuildLevelLayout(const AtlasResult& atlas, int resolution, const LayoutConfig& cfg, LayoutResult& out,
                      AtlasError& err);

// Re-check every invariant of a built atlas (partition, membership, cross
// level consistency, density range, non-overlap of every level's layout).
bool VerifyAtlas(const AtlasResult& atlas, const AtlasConfig& cfg, std::string& outWhy);

// Write viewer documents for `resolutions` (empty = all levels) into outDir.
bool ExportAtlasViewer(const std::string& outDir, const std::vector<Item>& items, const AtlasResult& atlas,
                       const AtlasConfig& cfg, const std::vector<int>& resolutions, ExportResult& out,
                       AtlasError& err);

} // namespace gridatlas
