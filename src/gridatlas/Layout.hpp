#pragma once

#include "gridatlas/Config.hpp"
#include "gridatlas/Representatives.hpp"
#include "gridatlas/Types.hpp"

#include <string>
#include <vector>

namespace gridatlas {

// -----------------------------------------------------------------------------
// Board layout
//
// Every placement sits at its cell center on a board centered on the origin:
//   x = (col + 0.5 - N/2) * pitch
//   y = (row + 0.5 - N/2) * pitch
// and is sized by density between minSize and baseSize. Sizes are capped at
// pitch - spacing, so two boxes in distinct cells always keep at least
// `spacing` between them. Positions are never moved.
// -----------------------------------------------------------------------------

struct LayoutInput {
  int item = -1;
  CellCoord cell{};
  double density = 0.0;

  // Finest-resolution cell of `item`.
  CellCoord leaf{};
};

struct CaptionBox {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  std::string text;
};

struct Placement {
  int item = -1;
  CellCoord cell{};
  CellCoord leaf{};
  double x = 0.0;
  double y = 0.0;
  double size = 0.0;
  bool shrunk = false;
};

struct LayoutResult {
  int resolution = 0;

  // Resolution of Placement::leaf; 0 when the inputs carried no leaf cells.
  int leafResolution = 0;
  double pitch = 0.0;
  double spacing = 0.0;

  // Board spans [-extent, extent] on both axes.
  double extent = 0.0;

  // Ordered by (row, col).
  std::vector<Placement> placements;
  int shrunkCount = 0;
};

// Compute placements for one resolution. Inputs must occupy distinct cells.
bool ComputeLayout(const std::vector<LayoutInput>& inputs, int resolution, const LayoutConfig& cfg,
                   LayoutResult& out, AtlasError& err);

// One input per populated cell: the cell representative and the cell's score.
std::vector<LayoutInput> BuildRepresentativeLayoutInputs(const RepresentativeLevel& level,
                                                         const std::vector<double>& cellScores);

// Sweep-line check that every pair of boxes keeps at least `spacing` apart
// (Chebyshev gap). outWhy names the first offending pair.
bool CheckLayoutNonOverlap(const LayoutResult& layout, double spacing, std::string& outWhy);

// Caption shown under a placement on the board.
CaptionBox MakeCaptionBox(const Placement& p, const std::string& caption, const LayoutConfig& cfg);

// Truncate to maxChars code points, replacing the tail with "...".
std::string TruncateCaption(const std::string& text, int maxChars);

} // namespace gridatlas
