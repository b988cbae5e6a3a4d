#include "gridatlas/Density.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace gridatlas {

double DensityNormalizer::score(int count) const
{
  if (count <= 0 || maxCount <= 0) return 0.0;

  double s = 0.0;
  switch (method) {
  case DensityMethod::Linear:
    s = static_cast<double>(count) / static_cast<double>(maxCount);
    break;
  case DensityMethod::Log:
    s = std::log1p(static_cast<double>(count)) / std::log1p(static_cast<double>(maxCount));
    break;
  case DensityMethod::Percentile: {
    const int clip = std::max(1, clipCount);
    s = static_cast<double>(std::min(count, clip)) / static_cast<double>(clip);
    break;
  }
  }
  return std::clamp(s, 0.0, 1.0);
}

int PercentileCount(std::vector<int> counts, double p)
{
  if (counts.empty()) return 0;
  std::sort(counts.begin(), counts.end());

  const double n = static_cast<double>(counts.size());
  std::size_t rank = static_cast<std::size_t>(std::ceil(std::clamp(p, 0.0, 1.0) * n));
  rank = std::clamp<std::size_t>(rank, 1, counts.size());
  return counts[rank - 1];
}

DensityNormalizer MakeDensityNormalizer(const GridLevel& level, const DensityConfig& cfg)
{
  DensityNormalizer norm;
  norm.method = cfg.method;

  std::vector<int> counts;
  counts.reserve(level.cells.size());
  for (const GridCell& c : level.cells) {
    const int n = static_cast<int>(c.items.size());
    counts.push_back(n);
    norm.maxCount = std::max(norm.maxCount, n);
  }

  norm.clipCount = (cfg.method == DensityMethod::Percentile) ? PercentileCount(std::move(counts), cfg.percentile)
                                                             : norm.maxCount;
  return norm;
}

std::vector<double> ComputeCellDensity(const GridLevel& level, const DensityConfig& cfg)
{
  const DensityNormalizer norm = MakeDensityNormalizer(level, cfg);

  std::vector<double> out;
  out.reserve(level.cells.size());
  for (const GridCell& c : level.cells) out.push_back(norm.score(static_cast<int>(c.items.size())));
  return out;
}

bool ComputeItemDensity(const GridHierarchy& hierarchy, const DensityConfig& cfg, DensityResult& out,
                        AtlasError& err)
{
  out = DensityResult{};
  if (hierarchy.levels.empty()) return true;

  const GridLevel* level = (cfg.referenceResolution > 0) ? hierarchy.findLevel(cfg.referenceResolution)
                                                         : hierarchy.finest();
  if (!level) {
    FailConfig(err, "density reference resolution " + std::to_string(cfg.referenceResolution) +
                        " is not a configured resolution");
    err.resolution = cfg.referenceResolution;
    return false;
  }

  const DensityNormalizer norm = MakeDensityNormalizer(*level, cfg);
  const std::vector<double> cellScores = ComputeCellDensity(*level, cfg);

  out.resolution = level->resolution;
  out.maxCount = norm.maxCount;
  out.clipCount = norm.clipCount;
  out.scores.resize(static_cast<std::size_t>(hierarchy.itemCount), 0.0);
  for (std::size_t i = 0; i < out.scores.size(); ++i) {
    const int cell = level->itemCell[i];
    if (cell >= 0) out.scores[i] = cellScores[static_cast<std::size_t>(cell)];
  }
  return true;
}

} // namespace gridatlas
