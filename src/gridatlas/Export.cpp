#include "gridatlas/Export.hpp"

#include "gridatlas/FileSync.hpp"
#include "gridatlas/Hash.hpp"
#include "gridatlas/Json.hpp"
#include "gridatlas/SpatialGrid.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace gridatlas {

namespace {

const Placement* FindPlacement(const LayoutResult& layout, const CellCoord& cell)
{
  auto it = std::lower_bound(layout.placements.begin(), layout.placements.end(), cell,
                             [](const Placement& p, const CellCoord& c) { return CellLess(p.cell, c); });
  if (it == layout.placements.end() || it->cell != cell) return nullptr;
  return &(*it);
}

// Writes one cell value. The writer is sticky, so one check at the end
// catches any failed call.
bool WriteCellValue(JsonWriter& w, const std::vector<Item>& items, const RepresentativeLevel& level,
                    const CellRepresentative& rep, const Placement* placement, const ExportConfig& cfg)
{
  const Item& it = items[static_cast<std::size_t>(rep.item)];
  const bool hasLeaf = level.leafResolution > 0;
  const std::string img = ExpandImageTemplate(cfg.imageTemplate, hasLeaf ? level.leafResolution : level.resolution,
                                              hasLeaf ? rep.leaf : rep.cell, it.id, it.meta.image);

  bool ok = w.beginObject() && w.memberInt("count", rep.count) && w.member("id", it.id) &&
            w.member("img", img) &&
            w.member("url", it.meta.url) && w.member("caption", it.meta.caption);

  if (ok && cfg.includeExamples) {
    ok = w.key("examples") && w.beginArray();
    for (std::size_t k = 0; ok && k < rep.examples.size(); ++k) {
      const Item& ex = items[static_cast<std::size_t>(rep.examples[k])];
      ok = w.beginObject() && w.member("id", ex.id) && w.member("url", ex.meta.url) &&
           w.member("caption", ex.meta.caption) && w.endObject();
    }
    ok = ok && w.endArray();
  }

  if (ok && cfg.includePlacement && placement) {
    ok = w.key("placement") && w.beginObject() && w.member("x", placement->x) && w.member("y", placement->y) &&
         w.member("size", placement->size) && w.endObject();
  }

  return ok && w.endObject();
}

bool IsPartFileOf(const std::filesystem::path& p, const std::string& base, int* outIndex)
{
  if (p.extension() != ".json") return false;
  const std::string stem = p.stem().string();
  const std::string prefix = base + "_part";
  if (stem.size() <= prefix.size() || stem.compare(0, prefix.size(), prefix) != 0) return false;

  int index = 0;
  for (std::size_t i = prefix.size(); i < stem.size(); ++i) {
    const char c = stem[i];
    if (c < '0' || c > '9') return false;
    if (index > 100000000) return false;
    index = index * 10 + (c - '0');
  }
  if (outIndex) *outIndex = index;
  return true;
}

// Remove outputs of one resolution that the current export does not produce.
bool RemoveStaleViewerFiles(const std::filesystem::path& dir, const std::string& base, int keepParts,
                            AtlasError& err)
{
  std::string rmErr;
  if (keepParts > 0) {
    if (!RemoveFileIfExists(dir / (base + ".json"), rmErr)) return FailSerialization(err, rmErr, (dir / base).string());
  }

  std::error_code ec;
  std::vector<std::filesystem::path> stale;
  for (std::filesystem::directory_iterator itDir(dir, ec), end; !ec && itDir != end; itDir.increment(ec)) {
    int index = 0;
    if (IsPartFileOf(itDir->path(), base, &index) && (keepParts == 0 || index > keepParts)) {
      stale.push_back(itDir->path());
    }
  }
  if (ec) return FailSerialization(err, "unable to list output directory: " + ec.message(), dir.string());

  std::sort(stale.begin(), stale.end());
  for (const std::filesystem::path& p : stale) {
    if (!RemoveFileIfExists(p, rmErr)) return FailSerialization(err, rmErr, p.string());
  }
  return true;
}

bool WriteTracked(const std::filesystem::path& path, int resolution, const std::string& bytes, int attempts,
                  ExportResult& out, AtlasError& err)
{
  if (!WriteFileAtomic(path, bytes, attempts, err)) {
    err.resolution = resolution;
    return false;
  }
  ExportedFile f;
  f.path = path.string();
  f.resolution = resolution;
  f.bytes = static_cast<std::uint64_t>(bytes.size());
  f.hash = HashBytes(bytes);
  out.add(std::move(f));
  return true;
}

bool EnsureOutputDir(const std::filesystem::path& dir, AtlasError& err)
{
  if (dir.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) return FailSerialization(err, "unable to create output directory: " + ec.message(), dir.string());
  return true;
}

std::string BoardImage(const Item& it, const LayoutResult& layout, const Placement& p, const ExportConfig& cfg)
{
  if (layout.leafResolution > 0) {
    return ExpandImageTemplate(cfg.imageTemplate, layout.leafResolution, p.leaf, it.id, it.meta.image);
  }
  return ExpandImageTemplate(cfg.imageTemplate, layout.resolution, p.cell, it.id, it.meta.image);
}

std::size_t BoardCount(const LayoutResult& layout, const BoardOptions& opt)
{
  const std::size_t n = layout.placements.size();
  if (opt.limit > 0) return std::min(n, static_cast<std::size_t>(opt.limit));
  return n;
}

} // namespace

void ExportResult::add(ExportedFile f)
{
  if (files.empty()) hash = kFNVOffset;
  hash = HashCombine(hash, f.hash);
  files.push_back(std::move(f));
}

std::string ExpandImageTemplate(const std::string& tmpl, int resolution, const CellCoord& cell,
                                const std::string& id, const std::string& fallback)
{
  if (tmpl.empty()) return fallback;

  std::string out;
  out.reserve(tmpl.size() + 16);
  for (std::size_t i = 0; i < tmpl.size();) {
    if (tmpl[i] == '{') {
      const std::size_t close = tmpl.find('}', i + 1);
      if (close != std::string::npos) {
        const std::string name = tmpl.substr(i + 1, close - i - 1);
        bool known = true;
        if (name == "level") out += std::to_string(resolution);
        else if (name == "col") out += std::to_string(cell.col);
        else if (name == "row") out += std::to_string(cell.row);
        else if (name == "id") out += id;
        else known = false;

        if (known) {
          i = close + 1;
          continue;
        }
      }
    }
    out.push_back(tmpl[i]);
    ++i;
  }
  return out;
}

bool BuildViewerEntries(const std::vector<Item>& items, const RepresentativeLevel& level, const LayoutResult* layout,
                        const ExportConfig& cfg, std::vector<ViewerEntry>& out, AtlasError& err)
{
  out.clear();
  out.reserve(level.reps.size());

  JsonWriteOptions opt;
  opt.pretty = false;

  for (const CellRepresentative& rep : level.reps) {
    if (rep.item < 0) continue;
    const Placement* p = layout ? FindPlacement(*layout, rep.cell) : nullptr;

    std::ostringstream oss;
    JsonWriter w(oss, opt);
    if (!WriteCellValue(w, items, level, rep, p, cfg)) {
      FailSerialization(err, "unable to serialize cell: " + w.error());
      err.resolution = level.resolution;
      err.col = rep.cell.col;
      err.row = rep.cell.row;
      return false;
    }

    ViewerEntry e;
    e.key = CellKey(rep.cell);
    e.json = oss.str();
    out.push_back(std::move(e));
  }

  // String order, so "10,0" sorts before "2,0".
  std::sort(out.begin(), out.end(), [](const ViewerEntry& a, const ViewerEntry& b) { return a.key < b.key; });
  return true;
}

std::string JoinViewerEntries(const std::vector<ViewerEntry>& entries, std::size_t first, std::size_t last)
{
  last = std::min(last, entries.size());

  std::string out;
  out.push_back('{');
  for (std::size_t i = first; i < last; ++i) {
    if (i > first) out.push_back(',');
    out.push_back('"');
    out += JsonEscape(entries[i].key);
    out += "\":";
    out += entries[i].json;
  }
  out.push_back('}');
  return out;
}

std::vector<std::string> SplitViewerDocument(const std::vector<ViewerEntry>& entries, std::uint64_t maxBytes)
{
  std::vector<std::string> docs;
  std::string full = JoinViewerEntries(entries, 0, entries.size());
  const std::uint64_t size = static_cast<std::uint64_t>(full.size());

  if (maxBytes == 0 || size <= maxBytes || entries.size() <= 1) {
    docs.push_back(std::move(full));
    return docs;
  }

  std::uint64_t parts = (size + maxBytes - 1) / maxBytes;
  parts = std::min<std::uint64_t>(parts, entries.size());

  const std::uint64_t n = entries.size();
  docs.reserve(static_cast<std::size_t>(parts));
  for (std::uint64_t p = 0; p < parts; ++p) {
    const std::size_t first = static_cast<std::size_t>(p * n / parts);
    const std::size_t last = static_cast<std::size_t>((p + 1) * n / parts);
    docs.push_back(JoinViewerEntries(entries, first, last));
  }
  return docs;
}

std::string ViewerBaseName(int resolution) { return "grid_" + std::to_string(resolution); }

bool ExportViewerLevel(const std::string& outDir, const std::vector<Item>& items, const RepresentativeLevel& level,
                       const LayoutResult* layout, const ExportConfig& cfg, ExportResult& out, AtlasError& err)
{
  const std::filesystem::path dir = outDir.empty() ? std::filesystem::path(".") : std::filesystem::path(outDir);
  if (!EnsureOutputDir(dir, err)) return false;

  const std::string base = ViewerBaseName(level.resolution);
  std::vector<ViewerEntry> entries;
  if (!BuildViewerEntries(items, level, layout, cfg, entries, err)) return false;
  const std::vector<std::string> docs = SplitViewerDocument(entries, cfg.maxFileBytes);

  if (docs.size() == 1) {
    if (!WriteTracked(dir / (base + ".json"), level.resolution, docs.front(), cfg.writeRetries, out, err)) return false;
    return RemoveStaleViewerFiles(dir, base, 0, err);
  }

  for (std::size_t k = 0; k < docs.size(); ++k) {
    const std::filesystem::path p = dir / (base + "_part" + std::to_string(k + 1) + ".json");
    if (!WriteTracked(p, level.resolution, docs[k], cfg.writeRetries, out, err)) return false;
  }
  return RemoveStaleViewerFiles(dir, base, static_cast<int>(docs.size()), err);
}

bool BuildBoardJson(const std::vector<Item>& items, const LayoutResult& layout, const LayoutConfig& layoutCfg,
                    const ExportConfig& cfg, const BoardOptions& opt, std::string& out, AtlasError& err)
{
  out.clear();
  const std::size_t count = BoardCount(layout, opt);

  std::ostringstream oss;
  JsonWriter w(oss);
  bool ok = w.beginObject() && w.memberInt("resolution", layout.resolution) &&
            w.member("base_size", layoutCfg.baseSize) && w.member("min_size", layoutCfg.minSize) &&
            w.member("spacing", layoutCfg.spacing) && w.member("pitch", layout.pitch) &&
            w.member("extent", layout.extent) && w.memberInt("count", static_cast<std::int64_t>(count)) &&
            w.memberInt("shrunk", layout.shrunkCount) && w.key("placements") && w.beginArray();

  for (std::size_t k = 0; ok && k < count; ++k) {
    const Placement& p = layout.placements[k];
    const Item& it = items[static_cast<std::size_t>(p.item)];
    const CaptionBox cap = MakeCaptionBox(p, it.meta.caption, layoutCfg);

    ok = w.beginObject() && w.member("id", it.id) && w.member("x", p.x) && w.member("y", p.y) &&
         w.member("size", p.size) && w.member("img", BoardImage(it, layout, p, cfg)) &&
         w.member("url", it.meta.url) && w.member("title", cap.text) && w.key("caption") && w.beginObject() &&
         w.member("x", cap.x) && w.member("y", cap.y) && w.member("width", cap.width) && w.endObject() &&
         w.endObject();
  }
  ok = ok && w.endArray() && w.endObject();

  if (!ok) {
    FailSerialization(err, "unable to serialize board placements: " + w.error());
    err.resolution = layout.resolution;
    return false;
  }
  oss << '\n';
  out = oss.str();
  return true;
}

std::string CsvEscape(const std::string& s)
{
  if (s.find_first_of(",\"\r\n") == std::string::npos) return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string BuildBoardCsv(const std::vector<Item>& items, const LayoutResult& layout, const LayoutConfig& layoutCfg,
                          const ExportConfig& cfg, const BoardOptions& opt)
{
  const std::size_t count = BoardCount(layout, opt);

  std::ostringstream oss;
  oss << "id,x,y,size,img,url,title\n";
  for (std::size_t k = 0; k < count; ++k) {
    const Placement& p = layout.placements[k];
    const Item& it = items[static_cast<std::size_t>(p.item)];
    oss << CsvEscape(it.id) << ',' << JsonNumberText(p.x) << ',' << JsonNumberText(p.y) << ','
        << JsonNumberText(p.size) << ',' << CsvEscape(BoardImage(it, layout, p, cfg)) << ','
        << CsvEscape(it.meta.url) << ',' << CsvEscape(TruncateCaption(it.meta.caption, layoutCfg.captionMaxChars))
        << '\n';
  }
  return oss.str();
}

bool ExportBoard(const std::string& jsonPath, const std::string& csvPath, const std::vector<Item>& items,
                 const LayoutResult& layout, const LayoutConfig& layoutCfg, const ExportConfig& cfg,
                 const BoardOptions& opt, ExportResult& out, AtlasError& err)
{
  if (!jsonPath.empty()) {
    const std::filesystem::path p(jsonPath);
    if (!EnsureOutputDir(p.parent_path(), err)) return false;
    std::string doc;
    if (!BuildBoardJson(items, layout, layoutCfg, cfg, opt, doc, err)) return false;
    if (!WriteTracked(p, layout.resolution, doc, cfg.writeRetries, out, err)) return false;
  }
  if (!csvPath.empty()) {
    const std::filesystem::path p(csvPath);
    if (!EnsureOutputDir(p.parent_path(), err)) return false;
    if (!WriteTracked(p, layout.resolution, BuildBoardCsv(items, layout, layoutCfg, cfg, opt), cfg.writeRetries, out,
                      err)) {
      return false;
    }
  }
  return true;
}

} // namespace gridatlas
