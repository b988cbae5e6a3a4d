#include "gridatlas/Atlas.hpp"

#include "gridatlas/ItemTable.hpp"
#include "gridatlas/Parallel.hpp"

#include <cmath>
#include <cstddef>
#include <sstream>

namespace gridatlas {

int AtlasResult::levelIndex(int resolution) const
{
  for (std::size_t i = 0; i < hierarchy.levels.size(); ++i) {
    if (hierarchy.levels[i].resolution == resolution) return static_cast<int>(i);
  }
  return -1;
}

bool BuildAtlas(const std::vector<Item>& items, const AtlasConfig& cfg, AtlasResult& out, AtlasError& err)
{
  out = AtlasResult{};
  if (!ValidateAtlasConfig(cfg, err)) return false;
  if (!ValidateItems(items, err)) return false;

  out.bounds = ComputeBounds(items, cfg.grid.boundsMargin);
  if (!std::isfinite(out.bounds.minX) || !std::isfinite(out.bounds.maxX) || !std::isfinite(out.bounds.minY) ||
      !std::isfinite(out.bounds.maxY)) {
    return FailInput(err, "padded bounds overflow the double range; lower grid.bounds_margin");
  }
  out.hierarchy = BuildGridHierarchy(items, out.bounds, cfg.grid.resolutions, &out.warnings);
  out.representatives = SelectRepresentatives(items, out.hierarchy, cfg.selection, cfg.threads);

  const int levelCount = static_cast<int>(out.hierarchy.levels.size());
  out.cellDensity.resize(static_cast<std::size_t>(levelCount));
  ParallelForIndex(levelCount, cfg.threads, [&](int li) {
    const std::size_t i = static_cast<std::size_t>(li);
    out.cellDensity[i] = ComputeCellDensity(out.hierarchy.levels[i], cfg.density);
  });

  return ComputeItemDensity(out.hierarchy, cfg.density, out.density, err);
}

bool BuildLevelLayout(const AtlasResult& atlas, int resolution, const LayoutConfig& cfg, LayoutResult& out,
                      AtlasError& err)
{
  const int li = atlas.levelIndex(resolution);
  if (li < 0) {
    FailConfig(err, "layout resolution " + std::to_string(resolution) + " is not a configured resolution");
    err.resolution = resolution;
    return false;
  }

  const std::size_t i = static_cast<std::size_t>(li);
  const std::vector<LayoutInput> inputs =
      BuildRepresentativeLayoutInputs(atlas.representatives[i], atlas.cellDensity[i]);
  if (!ComputeLayout(inputs, resolution, cfg, out, err)) return false;
  out.leafResolution = atlas.representatives[i].leafResolution;
  return true;
}

bool VerifyAtlas(const AtlasResult& atlas, const AtlasConfig& cfg, std::string& outWhy)
{
  if (!CheckRepresentativeInvariants(atlas.hierarchy, atlas.representatives, outWhy)) return false;

  for (double s : atlas.density.scores) {
    if (!std::isfinite(s) || s < 0.0 || s > 1.0) {
      outWhy = "density score outside [0, 1]";
      return false;
    }
  }

  for (const GridLevel& level : atlas.hierarchy.levels) {
    LayoutResult layout;
    AtlasError err;
    if (!BuildLevelLayout(atlas, level.resolution, cfg.layout, layout, err)) {
      outWhy = FormatAtlasError(err);
      return false;
    }
    if (!CheckLayoutNonOverlap(layout, cfg.layout.spacing, outWhy)) {
      outWhy = "resolution " + std::to_string(level.resolution) + ": " + outWhy;
      return false;
    }
  }
  return true;
}

bool ExportAtlasViewer(const std::string& outDir, const std::vector<Item>& items, const AtlasResult& atlas,
                       const AtlasConfig& cfg, const std::vector<int>& resolutions, ExportResult& out,
                       AtlasError& err)
{
  std::vector<int> levels = resolutions;
  if (levels.empty()) {
    for (const GridLevel& l : atlas.hierarchy.levels) levels.push_back(l.resolution);
  }

  for (int r : levels) {
    const int li = atlas.levelIndex(r);
    if (li < 0) {
      FailConfig(err, "resolution " + std::to_string(r) + " is not a configured resolution");
      err.resolution = r;
      return false;
    }

    LayoutResult layout;
    const LayoutResult* layoutPtr = nullptr;
    if (cfg.exportCfg.includePlacement) {
      if (!BuildLevelLayout(atlas, r, cfg.layout, layout, err)) return false;
      layoutPtr = &layout;
    }

    if (!ExportViewerLevel(outDir, items, atlas.representatives[static_cast<std::size_t>(li)], layoutPtr,
                           cfg.exportCfg, out, err)) {
      return false;
    }
  }
  return true;
}

} // namespace gridatlas
