#include "gridatlas/Config.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace gridatlas {

const char* SelectionPolicyName(SelectionPolicy p)
{
  switch (p) {
  case SelectionPolicy::Center: return "center";
  case SelectionPolicy::DensestSubcell: return "densest_subcell";
  case SelectionPolicy::ChildMaxCount: return "child_max_count";
  default: return "unknown";
  }
}

const char* TieBreakName(TieBreak t)
{
  switch (t) {
  case TieBreak::LowestId: return "lowest_id";
  case TieBreak::InputOrder: return "input_order";
  default: return "unknown";
  }
}

const char* DensityMethodName(DensityMethod m)
{
  switch (m) {
  case DensityMethod::Linear: return "linear";
  case DensityMethod::Log: return "log";
  case DensityMethod::Percentile: return "percentile";
  default: return "unknown";
  }
}

bool ParseSelectionPolicy(const std::string& s, SelectionPolicy& out)
{
  if (s == "center") {
    out = SelectionPolicy::Center;
  } else if (s == "densest_subcell" || s == "densest") {
    out = SelectionPolicy::DensestSubcell;
  } else if (s == "child_max_count" || s == "hierarchical") {
    out = SelectionPolicy::ChildMaxCount;
  } else {
    return false;
  }
  return true;
}

bool ParseTieBreak(const std::string& s, TieBreak& out)
{
  if (s == "lowest_id" || s == "id") {
    out = TieBreak::LowestId;
  } else if (s == "input_order" || s == "input") {
    out = TieBreak::InputOrder;
  } else {
    return false;
  }
  return true;
}

bool ParseDensityMethod(const std::string& s, DensityMethod& out)
{
  if (s == "linear") {
    out = DensityMethod::Linear;
  } else if (s == "log") {
    out = DensityMethod::Log;
  } else if (s == "percentile") {
    out = DensityMethod::Percentile;
  } else {
    return false;
  }
  return true;
}

std::vector<int> SortedResolutions(const std::vector<int>& resolutions)
{
  std::vector<int> out = resolutions;
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

int FinestResolution(const GridConfig& cfg)
{
  int finest = 0;
  for (int r : cfg.resolutions) finest = std::max(finest, r);
  return finest;
}

int EffectiveDensityResolution(const AtlasConfig& cfg)
{
  if (cfg.density.referenceResolution > 0) return cfg.density.referenceResolution;
  return FinestResolution(cfg.grid);
}

double EffectiveCellPitch(const LayoutConfig& cfg)
{
  if (cfg.cellPitch > 0.0) return cfg.cellPitch;
  return cfg.baseSize + cfg.spacing;
}

bool ValidateLayoutConfig(const LayoutConfig& cfg, AtlasError& err)
{
  if (!std::isfinite(cfg.baseSize) || !std::isfinite(cfg.minSize) || !std::isfinite(cfg.spacing) ||
      !std::isfinite(cfg.cellPitch) || !std::isfinite(cfg.captionOffset)) {
    return FailConfig(err, "layout sizes must be finite");
  }
  if (!(cfg.minSize > 0.0)) return FailConfig(err, "layout min_size must be > 0");
  if (cfg.baseSize < cfg.minSize) return FailConfig(err, "layout base_size must be >= min_size");
  if (cfg.spacing < 0.0) return FailConfig(err, "layout spacing must be >= 0");
  if (cfg.cellPitch < 0.0) return FailConfig(err, "layout cell_pitch must be >= 0");
  if (cfg.captionMaxChars < 4) return FailConfig(err, "layout caption_max_chars must be >= 4");

  const double pitch = EffectiveCellPitch(cfg);
  if (cfg.minSize > pitch - cfg.spacing) {
    std::ostringstream oss;
    oss << "layout min_size " << cfg.minSize << " does not fit a cell pitch of " << pitch << " with spacing "
        << cfg.spacing << " (floor size would overlap its neighbours)";
    return FailConfig(err, oss.str());
  }
  return true;
}

bool ValidateAtlasConfig(const AtlasConfig& cfg, AtlasError& err)
{
  err.clear();

  const std::vector<int>& res = cfg.grid.resolutions;
  if (res.empty()) return FailConfig(err, "at least one resolution is required");

  constexpr int kMaxResolution = 1 << 15;
  for (int r : res) {
    if (r <= 0 || r > kMaxResolution) {
      err.resolution = r;
      return FailConfig(err, "resolution must be in [1, " + std::to_string(kMaxResolution) + "]");
    }
  }
  if (SortedResolutions(res).size() != res.size()) return FailConfig(err, "resolutions must be unique");

  const int finest = FinestResolution(cfg.grid);
  for (int r : res) {
    if (finest % r != 0) {
      err.resolution = r;
      return FailConfig(err, "resolution " + std::to_string(r) + " does not divide the finest resolution " +
                                 std::to_string(finest));
    }
  }

  if (!std::isfinite(cfg.grid.boundsMargin) || cfg.grid.boundsMargin < 0.0 || cfg.grid.boundsMargin > 1.0) {
    return FailConfig(err, "bounds margin must be in [0, 1]");
  }

  const SelectionConfig& sel = cfg.selection;
  if (sel.denseCellThreshold < 1) return FailConfig(err, "dense_cell_threshold must be >= 1");
  if (sel.subGridSize < 1 || sel.subGridSize > 1024) return FailConfig(err, "sub_grid_size must be in [1, 1024]");
  if (sel.examplesPerCell < 0) return FailConfig(err, "examples_per_cell must be >= 0");

  const DensityConfig& den = cfg.density;
  if (!std::isfinite(den.percentile) || !(den.percentile > 0.0) || den.percentile > 1.0) {
    return FailConfig(err, "density percentile must be in (0, 1]");
  }
  if (den.referenceResolution != 0 &&
      std::find(res.begin(), res.end(), den.referenceResolution) == res.end()) {
    err.resolution = den.referenceResolution;
    return FailConfig(err, "density reference resolution is not one of the configured resolutions");
  }

  if (!ValidateLayoutConfig(cfg.layout, err)) return false;

  if (cfg.exportCfg.maxFileBytes == 0) return FailConfig(err, "max_file_bytes must be > 0");
  if (cfg.exportCfg.writeRetries < 1) return FailConfig(err, "write_retries must be >= 1");

  return true;
}

} // namespace gridatlas
