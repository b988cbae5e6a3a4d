#include "gridatlas/Layout.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <sstream>

namespace gridatlas {

namespace {

struct Box {
  double x0, y0, x1, y1;
  std::size_t idx;
};

} // namespace

bool ComputeLayout(const std::vector<LayoutInput>& inputs, int resolution, const LayoutConfig& cfg,
                   LayoutResult& out, AtlasError& err)
{
  out = LayoutResult{};
  if (!ValidateLayoutConfig(cfg, err)) return false;
  if (resolution <= 0) {
    FailConfig(err, "layout resolution must be positive");
    err.resolution = resolution;
    return false;
  }

  const double pitch = EffectiveCellPitch(cfg);
  const double cap = pitch - cfg.spacing;
  const double half = 0.5 * static_cast<double>(resolution);

  out.resolution = resolution;
  out.pitch = pitch;
  out.spacing = cfg.spacing;
  out.extent = half * pitch;

  std::vector<std::size_t> order(inputs.size());
  for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;
  std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    if (inputs[a].cell != inputs[b].cell) return CellLess(inputs[a].cell, inputs[b].cell);
    return a < b;
  });

  out.placements.reserve(inputs.size());
  for (std::size_t k = 0; k < order.size(); ++k) {
    const LayoutInput& in = inputs[order[k]];

    if (in.cell.col < 0 || in.cell.row < 0 || in.cell.col >= resolution || in.cell.row >= resolution) {
      out.placements.clear();
      FailInput(err, "layout input lies outside the grid");
      err.resolution = resolution;
      err.col = in.cell.col;
      err.row = in.cell.row;
      return false;
    }
    if (k > 0 && inputs[order[k - 1]].cell == in.cell) {
      FailInput(err, "two layout inputs share one cell");
      err.resolution = resolution;
      err.col = in.cell.col;
      err.row = in.cell.row;
      out.placements.clear();
      return false;
    }

    const double score = std::isfinite(in.density) ? std::clamp(in.density, 0.0, 1.0) : 0.0;

    Placement p;
    p.item = in.item;
    p.cell = in.cell;
    p.leaf = in.leaf;
    p.x = (static_cast<double>(in.cell.col) + 0.5 - half) * pitch;
    p.y = (static_cast<double>(in.cell.row) + 0.5 - half) * pitch;
    p.size = cfg.minSize + score * (cfg.baseSize - cfg.minSize);
    if (p.size > cap) {
      p.size = cap;
      p.shrunk = true;
      ++out.shrunkCount;
    }
    out.placements.push_back(p);
  }

  return true;
}

std::vector<LayoutInput> BuildRepresentativeLayoutInputs(const RepresentativeLevel& level,
                                                         const std::vector<double>& cellScores)
{
  std::vector<LayoutInput> out;
  out.reserve(level.reps.size());
  for (std::size_t k = 0; k < level.reps.size(); ++k) {
    LayoutInput in;
    in.item = level.reps[k].item;
    in.cell = level.reps[k].cell;
    in.leaf = level.reps[k].leaf;
    in.density = (k < cellScores.size()) ? cellScores[k] : 0.0;
    out.push_back(in);
  }
  return out;
}

bool CheckLayoutNonOverlap(const LayoutResult& layout, double spacing, std::string& outWhy)
{
  outWhy.clear();
  const std::vector<Placement>& ps = layout.placements;
  const double eps = 1e-9 * std::max(1.0, layout.pitch);

  // Grow every box by spacing/2 per side; a violation is then a plain
  // rectangle intersection deeper than eps.
  std::vector<Box> boxes;
  boxes.reserve(ps.size());
  for (std::size_t i = 0; i < ps.size(); ++i) {
    const double h = 0.5 * ps[i].size + 0.5 * spacing;
    boxes.push_back(Box{ps[i].x - h, ps[i].y - h, ps[i].x + h, ps[i].y + h, i});
  }
  std::sort(boxes.begin(), boxes.end(), [](const Box& a, const Box& b) {
    if (a.x0 != b.x0) return a.x0 < b.x0;
    return a.idx < b.idx;
  });

  std::vector<Box> active;
  for (const Box& b : boxes) {
    active.erase(std::remove_if(active.begin(), active.end(), [&](const Box& a) { return a.x1 <= b.x0 + eps; }),
                 active.end());

    for (const Box& a : active) {
      const bool overlapY = (a.y0 < b.y1 - eps) && (b.y0 < a.y1 - eps);
      if (!overlapY) continue;

      const Placement& pa = ps[a.idx];
      const Placement& pb = ps[b.idx];
      std::ostringstream oss;
      oss << "placements closer than spacing " << spacing << ": item " << pa.item << " at cell "
          << CellKey(pa.cell) << " and item " << pb.item << " at cell " << CellKey(pb.cell);
      outWhy = oss.str();
      return false;
    }
    active.push_back(b);
  }
  return true;
}

CaptionBox MakeCaptionBox(const Placement& p, const std::string& caption, const LayoutConfig& cfg)
{
  CaptionBox box;
  box.x = p.x;
  box.y = p.y + 0.5 * p.size + cfg.captionOffset;
  box.width = p.size;
  box.text = TruncateCaption(caption, cfg.captionMaxChars);
  return box;
}

std::string TruncateCaption(const std::string& text, int maxChars)
{
  if (maxChars <= 0) return std::string();

  // Count UTF-8 code points (continuation bytes are 10xxxxxx).
  auto isLead = [](unsigned char c) { return (c & 0xC0u) != 0x80u; };

  int points = 0;
  for (unsigned char c : text) {
    if (isLead(c)) ++points;
  }
  if (points <= maxChars) return text;

  const int keep = std::max(0, maxChars - 3);
  int seen = 0;
  std::size_t cut = 0;
  for (; cut < text.size(); ++cut) {
    if (isLead(static_cast<unsigned char>(text[cut]))) {
      if (seen == keep) break;
      ++seen;
    }
  }
  return text.substr(0, cut) + "...";
}

} // namespace gridatlas
