#pragma once

#include "gridatlas/Config.hpp"
#include "gridatlas/Error.hpp"
#include "gridatlas/Layout.hpp"
#include "gridatlas/Representatives.hpp"
#include "gridatlas/Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gridatlas {

// -----------------------------------------------------------------------------
// Exporters
//
// Viewer documents: one compact JSON object per resolution, keyed "col,row"
// (keys sorted lexicographically as strings), each value
//   {count, id, img, url, caption, examples?:[{id,url,caption}], placement?:{x,y,size}}
// Output bytes depend only on the inputs and the configuration.
//
// Board documents: the placements of one resolution for an upload
// collaborator, as JSON (with the layout configuration echoed) and CSV.
//
// Every file is committed with WriteFileAtomic.
// -----------------------------------------------------------------------------

// Expand {level} {col} {row} {id} in an image template. An empty template
// returns `fallback`. Exporters pass the finest-resolution cell of the
// representative, so every level of the atlas names the same leaf image for
// the same item.
std::string ExpandImageTemplate(const std::string& tmpl, int resolution, const CellCoord& cell,
                                const std::string& id, const std::string& fallback);

// One serialized `"col,row":{...}` member per populated cell, sorted by key.
// `layout` (optional) supplies placements when cfg.includePlacement is set.
struct ViewerEntry {
  std::string key;
  std::string json;
};

bool BuildViewerEntries(const std::vector<Item>& items, const RepresentativeLevel& level, const LayoutResult* layout,
                        const ExportConfig& cfg, std::vector<ViewerEntry>& out, AtlasError& err);

// Join entries into one object document.
std::string JoinViewerEntries(const std::vector<ViewerEntry>& entries, std::size_t first, std::size_t last);

// Split into K = ceil(bytes / maxBytes) documents of evenly many entries in
// key order. Returns a single document when it fits.
std::vector<std::string> SplitViewerDocument(const std::vector<ViewerEntry>& entries, std::uint64_t maxBytes);

// File base name of one resolution: "grid_<N>".
std::string ViewerBaseName(int resolution);

struct ExportedFile {
  std::string path;
  int resolution = 0;
  std::uint64_t bytes = 0;
  std::uint64_t hash = 0;
};

struct ExportResult {
  std::vector<ExportedFile> files;

  // FNV-1a chained over every written file in order.
  std::uint64_t hash = 0;

  void add(ExportedFile f);
};

// Write one resolution as <outDir>/grid_<N>.json, or grid_<N>_part<k>.json
// when it exceeds cfg.maxFileBytes. Outputs of the other shape left by a
// previous run are removed.
bool ExportViewerLevel(const std::string& outDir, const std::vector<Item>& items, const RepresentativeLevel& level,
                       const LayoutResult* layout, const ExportConfig& cfg, ExportResult& out, AtlasError& err);

// Placement list for an upload collaborator.
struct BoardOptions {
  // Export at most this many placements (0 = all), in (row, col) order.
  int limit = 0;
};

bool BuildBoardJson(const std::vector<Item>& items, const LayoutResult& layout, const LayoutConfig& layoutCfg,
                    const ExportConfig& cfg, const BoardOptions& opt, std::string& out, AtlasError& err);

std::string BuildBoardCsv(const std::vector<Item>& items, const LayoutResult& layout, const LayoutConfig& layoutCfg,
                          const ExportConfig& cfg, const BoardOptions& opt);

bool ExportBoard(const std::string& jsonPath, const std::string& csvPath, const std::vector<Item>& items,
                 const LayoutResult& layout, const LayoutConfig& layoutCfg, const ExportConfig& cfg,
                 const BoardOptions& opt, ExportResult& out, AtlasError& err);

// RFC 4180 field quoting for the CSV exporters.
std::string CsvEscape(const std::string& s);

} // namespace gridatlas
