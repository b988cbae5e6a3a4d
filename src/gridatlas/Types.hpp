#pragma once

#include <string>
#include <utility>
#include <vector>

namespace gridatlas {

// Opaque per-item metadata. The core never interprets these fields, it only
// passes them through to the exporters.
struct ItemMeta {
  std::string caption;
  std::string url;
  std::string image;

  // Any additional input columns, in input order.
  std::vector<std::pair<std::string, std::string>> extra;
};

// One projected item: a stable identifier, a 2D coordinate and its metadata.
struct Item {
  std::string id;
  double x = 0.0;
  double y = 0.0;
  ItemMeta meta;
};

// Axis-aligned bounding box of the projected coordinate space.
struct Bounds {
  double minX = 0.0;
  double minY = 0.0;
  double maxX = 0.0;
  double maxY = 0.0;

  double width() const { return maxX - minX; }
  double height() const { return maxY - minY; }
};

// Grid cell coordinate within one resolution. col indexes x, row indexes y.
struct CellCoord {
  int col = 0;
  int row = 0;
};

inline bool operator==(const CellCoord& a, const CellCoord& b) { return a.col == b.col && a.row == b.row; }
inline bool operator!=(const CellCoord& a, const CellCoord& b) { return !(a == b); }

// Row-major ordering used everywhere cells are sorted.
inline bool CellLess(const CellCoord& a, const CellCoord& b)
{
  if (a.row != b.row) return a.row < b.row;
  return a.col < b.col;
}

} // namespace gridatlas
