#pragma once

#include "gridatlas/Error.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gridatlas {

// How a populated cell picks its representative item.
enum class SelectionPolicy : std::uint8_t {
  // Item closest to the cell's geometric center.
  Center = 0,

  // Large cells are split into a mini grid; the item closest to the center of
  // the most populated mini cell wins. Small cells fall back to Center.
  DensestSubcell,

  // Finest level uses Center; every coarser cell reuses the representative of
  // its most populated child cell.
  ChildMaxCount,
};

// Tie-break applied when two candidates are equally good.
enum class TieBreak : std::uint8_t {
  LowestId = 0,   // lexicographically smallest identifier
  InputOrder,     // earliest row in the input table
};

enum class DensityMethod : std::uint8_t {
  Linear = 0,
  Log,
  Percentile,
};

const char* SelectionPolicyName(SelectionPolicy p);
const char* TieBreakName(TieBreak t);
const char* DensityMethodName(DensityMethod m);

bool ParseSelectionPolicy(const std::string& s, SelectionPolicy& out);
bool ParseTieBreak(const std::string& s, TieBreak& out);
bool ParseDensityMethod(const std::string& s, DensityMethod& out);

struct GridConfig {
  // Grid granularities (N means an N x N grid). Every entry must divide the
  // finest one so each coarse cell maps onto an integral block of finer cells.
  std::vector<int> resolutions = {64, 128, 256};

  // Fraction of the extent added as padding on each side of the tight bound.
  double boundsMargin = 0.0;
};

struct SelectionConfig {
  SelectionPolicy policy = SelectionPolicy::Center;
  TieBreak tieBreak = TieBreak::LowestId;

  // DensestSubcell: cells with more items than this use the mini grid.
  int denseCellThreshold = 50;
  int subGridSize = 10;

  // Example items recorded per cell for the viewer's list (0 disables).
  int examplesPerCell = 100;
};

struct DensityConfig {
  DensityMethod method = DensityMethod::Log;

  // Percentile in (0,1] used by DensityMethod::Percentile as the clip level.
  double percentile = 0.99;

  // Resolution whose cell occupancy drives item density. 0 = finest.
  int referenceResolution = 0;
};

struct LayoutConfig {
  // Size given to the densest item, in board units.
  double baseSize = 400.0;

  // Floor so sparse items stay visible.
  double minSize = 100.0;

  // Minimum gap between neighbouring placement boxes.
  double spacing = 50.0;

  // Distance between adjacent cell centers. 0 derives baseSize + spacing.
  double cellPitch = 0.0;

  // Board caption box placed under each image.
  double captionOffset = 20.0;
  int captionMaxChars = 100;
};

struct ExportConfig {
  // Write example lists into the viewer documents.
  bool includeExamples = true;

  // Write per-cell placements into the viewer documents.
  bool includePlacement = false;

  // Optional image reference template: {level} {col} {row} {id}.
  // Empty passes the item's own image reference through.
  std::string imageTemplate;

  // Documents larger than this are split into numbered parts.
  std::uint64_t maxFileBytes = 50ull * 1024ull * 1024ull;

  // Attempts for a failed write when the failure looks transient.
  int writeRetries = 3;
};

struct AtlasConfig {
  GridConfig grid{};
  SelectionConfig selection{};
  DensityConfig density{};
  LayoutConfig layout{};
  ExportConfig exportCfg{};

  // Worker threads for per-resolution work. <=0 uses hardware concurrency.
  int threads = 0;
};

// Resolutions sorted ascending with duplicates removed. Does not validate.
std::vector<int> SortedResolutions(const std::vector<int>& resolutions);

// Finest configured resolution (0 when none).
int FinestResolution(const GridConfig& cfg);

// The reference resolution density actually uses.
int EffectiveDensityResolution(const AtlasConfig& cfg);

// Distance between adjacent cell centers in board units.
double EffectiveCellPitch(const LayoutConfig& cfg);

// Validate everything that can be checked before touching any data.
// On failure err.kind == ErrorKind::Configuration.
bool ValidateAtlasConfig(const AtlasConfig& cfg, AtlasError& err);
bool ValidateLayoutConfig(const LayoutConfig& cfg, AtlasError& err);

} // namespace gridatlas
