#include "cli/CliMain.hpp"
#include "gridatlas/Atlas.hpp"
#include "gridatlas/ConfigIO.hpp"
#include "gridatlas/Export.hpp"
#include "gridatlas/FileSync.hpp"
#include "gridatlas/Hash.hpp"
#include "gridatlas/ItemTable.hpp"
#include "gridatlas/Json.hpp"
#include "gridatlas/Layout.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";               \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                       \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (std::fabs((_a) - (_b)) > (_e)) {                                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) {
    root = fs::current_path(ec);
    if (ec || root.empty()) {
      root = fs::path(".");
    }
  }

  const auto stamp = static_cast<std::uint64_t>(
    std::chrono::high_resolution_clock::now().time_since_epoch().count());

  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

static std::string ReadAll(const fs::path& p)
{
  std::ifstream f(p, std::ios::binary);
  std::ostringstream oss;
  oss << f.rdbuf();
  return oss.str();
}

static void WriteAll(const fs::path& p, const std::string& text)
{
  std::ofstream f(p, std::ios::binary);
  f << text;
}

static gridatlas::Item MakeItem(const std::string& id, double x, double y)
{
  gridatlas::Item it;
  it.id = id;
  it.x = x;
  it.y = y;
  it.meta.caption = "caption " + id;
  it.meta.url = "https://example.org/" + id;
  it.meta.image = "img/" + id + ".webp";
  return it;
}

static std::vector<gridatlas::Item> GridItems(int side)
{
  std::vector<gridatlas::Item> items;
  for (int r = 0; r < side; ++r) {
    for (int c = 0; c < side; ++c) {
      const int n = r * side + c;
      items.push_back(MakeItem("it" + std::to_string(n), c + 0.25 * (n % 3), r + 0.125 * (n % 5)));
    }
  }
  return items;
}

static void TestJsonBasics()
{
  using namespace gridatlas;

  EXPECT_EQ(JsonEscape("a\"b\\c\n"), std::string("a\\\"b\\\\c\\n"));
  EXPECT_EQ(JsonEscape(std::string("\x01")), std::string("\\u0001"));

  EXPECT_EQ(JsonNumberText(3.0), std::string("3"));
  EXPECT_EQ(JsonNumberText(-675.0), std::string("-675"));
  EXPECT_EQ(JsonNumberText(0.5), std::string("0.5"));
  EXPECT_EQ(JsonNumberText(std::nan("")), std::string("null"));

  JsonValue v;
  std::string err;
  ASSERT_TRUE(ParseJson("{\"a\": [1, 2.5, \"x\\u00e9\"], \"b\": {\"c\": true, \"d\": null}}", v, err));
  ASSERT_TRUE(v.isObject());
  const JsonValue* a = FindJsonMember(v, "a");
  ASSERT_TRUE(a && a->isArray() && a->arrayValue.size() == 3);
  EXPECT_NEAR(a->arrayValue[1].numberValue, 2.5, 1e-12);
  EXPECT_EQ(a->arrayValue[2].stringValue, std::string("x\xC3\xA9"));

  JsonWriteOptions compact;
  compact.pretty = false;
  EXPECT_EQ(JsonStringify(v, compact), std::string("{\"a\":[1,2.5,\"x\xC3\xA9\"],\"b\":{\"c\":true,\"d\":null}}"));

  EXPECT_FALSE(ParseJson("{\"a\": }", v, err));
  EXPECT_FALSE(err.empty());
  EXPECT_FALSE(ParseJson("[1, 2] trailing", v, err));

  EXPECT_EQ(HashBytes(""), kFNVOffset);
  EXPECT_EQ(HashBytes("a"), static_cast<std::uint64_t>(0xaf63dc4c8601ec8cull));
}

static void TestCsvIngestion()
{
  using namespace gridatlas;

  const std::string text = "\xEF\xBB\xBFid,x,y,caption,score\n"
                           "1,0.5,1.5,\"hello, world\",7\n"
                           "2,1,2,\"multi\nline\",8\n"
                           ",3,4,no id,9\n"
                           "3,,4,no x,1\n"
                           "\n"
                           "4,5,6,plain,2\r\n";

  std::istringstream is(text);
  ItemTable table;
  AtlasError err;
  ASSERT_TRUE(ParseItemCsv(is, ItemTableOptions{}, table, err));

  EXPECT_EQ(table.rowsRead, 5);
  EXPECT_EQ(table.rowsRejected, 2);
  ASSERT_TRUE(table.items.size() == 3);
  EXPECT_EQ(table.items[0].id, std::string("1"));
  EXPECT_EQ(table.items[0].meta.caption, std::string("hello, world"));
  ASSERT_TRUE(table.items[0].meta.extra.size() == 1);
  EXPECT_EQ(table.items[0].meta.extra[0].first, std::string("score"));
  EXPECT_EQ(table.items[0].meta.extra[0].second, std::string("7"));
  EXPECT_EQ(table.items[1].meta.caption, std::string("multi\nline"));
  EXPECT_EQ(table.items[2].id, std::string("4"));
  EXPECT_NEAR(table.items[2].x, 5.0, 1e-12);
  EXPECT_NEAR(table.items[2].y, 6.0, 1e-12);

  ASSERT_TRUE(table.warnings.size() == 2);
  EXPECT_TRUE(table.warnings[0].kind == WarningKind::RejectedRow);
  EXPECT_EQ(table.warnings[0].row, 3);
  EXPECT_EQ(table.warnings[0].message, std::string("missing id"));
  EXPECT_EQ(table.warnings[1].row, 4);
  EXPECT_EQ(table.warnings[1].message, std::string("missing x"));

  // Custom column names.
  std::istringstream renamed("name,lon,lat\nk,1,2\n");
  ItemTableOptions opt;
  opt.columns.id = "name";
  opt.columns.x = "lon";
  opt.columns.y = "lat";
  ASSERT_TRUE(ParseItemCsv(renamed, opt, table, err));
  ASSERT_TRUE(table.items.size() == 1);
  EXPECT_EQ(table.items[0].id, std::string("k"));
}

static void TestCsvInvalidRows()
{
  using namespace gridatlas;

  std::istringstream is("id,x,y\na,1,2\nb,abc,2\na,3,4\nc,inf,1\n");
  ItemTable table;
  AtlasError err;
  EXPECT_FALSE(ParseItemCsv(is, ItemTableOptions{}, table, err));
  EXPECT_TRUE(err.kind == ErrorKind::InputValidation);
  EXPECT_EQ(err.totalRowIssues, 3);
  ASSERT_TRUE(err.rows.size() == 3);
  EXPECT_EQ(err.rows[0].row, 2);
  EXPECT_EQ(err.rows[1].row, 3);
  EXPECT_TRUE(err.rows[1].reason.find("first seen at row 1") != std::string::npos);
  EXPECT_EQ(err.rows[2].itemId, std::string("c"));
  EXPECT_TRUE(table.items.empty());

  std::istringstream capped("id,x,y\na,x,1\nb,x,1\nc,x,1\n");
  ItemTableOptions opt;
  opt.maxReportedRows = 1;
  EXPECT_FALSE(ParseItemCsv(capped, opt, table, err));
  EXPECT_EQ(err.rows.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(err.totalRowIssues, 3);

  std::istringstream noY("id,x\na,1\n");
  EXPECT_FALSE(ParseItemCsv(noY, ItemTableOptions{}, table, err));
  EXPECT_TRUE(err.message.find("'y'") != std::string::npos);

  std::istringstream open("id,x,y\n\"a,1,2\n");
  EXPECT_FALSE(ParseItemCsv(open, ItemTableOptions{}, table, err));
  EXPECT_TRUE(err.message.find("unterminated") != std::string::npos);
}

static void TestJsonLinesIngestion()
{
  using namespace gridatlas;

  std::istringstream is("{\"id\":\"a\",\"x\":1,\"y\":2,\"caption\":\"A\",\"tag\":\"t\"}\n"
                        "\n"
                        "{\"id\":7,\"x\":\"3.5\",\"y\":4}\r\n"
                        "{\"id\":\"c\",\"y\":1}\n");
  ItemTable table;
  AtlasError err;
  ASSERT_TRUE(ParseItemJsonLines(is, ItemTableOptions{}, table, err));
  EXPECT_EQ(table.rowsRead, 3);
  EXPECT_EQ(table.rowsRejected, 1);
  ASSERT_TRUE(table.items.size() == 2);
  EXPECT_EQ(table.items[0].meta.caption, std::string("A"));
  ASSERT_TRUE(table.items[0].meta.extra.size() == 1);
  EXPECT_EQ(table.items[0].meta.extra[0].second, std::string("t"));
  EXPECT_EQ(table.items[1].id, std::string("7"));
  EXPECT_NEAR(table.items[1].x, 3.5, 1e-12);
  ASSERT_TRUE(table.warnings.size() == 1);
  EXPECT_EQ(table.warnings[0].row, 4);

  std::istringstream bad("[1,2]\n{bad\n{\"id\":\"ok\",\"x\":0,\"y\":0}\n");
  EXPECT_FALSE(ParseItemJsonLines(bad, ItemTableOptions{}, table, err));
  EXPECT_EQ(err.totalRowIssues, 2);
  ASSERT_TRUE(err.rows.size() == 2);
  EXPECT_EQ(err.rows[0].row, 1);
  EXPECT_EQ(err.rows[1].row, 2);

  ItemTableFormat fmt = ItemTableFormat::Auto;
  EXPECT_TRUE(DetectItemTableFormat("points.NDJSON", fmt));
  EXPECT_TRUE(fmt == ItemTableFormat::JsonLines);
  EXPECT_TRUE(DetectItemTableFormat("dir/points.csv", fmt));
  EXPECT_TRUE(fmt == ItemTableFormat::Csv);
  EXPECT_FALSE(DetectItemTableFormat("points.parquet", fmt));

  EXPECT_FALSE(LoadItemTable("points.parquet", ItemTableOptions{}, table, err));
  EXPECT_TRUE(err.kind == ErrorKind::Configuration);
}

static void TestConfigJson()
{
  using namespace gridatlas;

  AtlasConfig cfg;
  cfg.grid.resolutions = {8, 32};
  cfg.grid.boundsMargin = 0.05;
  cfg.selection.policy = SelectionPolicy::DensestSubcell;
  cfg.selection.tieBreak = TieBreak::InputOrder;
  cfg.selection.examplesPerCell = 12;
  cfg.density.method = DensityMethod::Percentile;
  cfg.density.percentile = 0.95;
  cfg.layout.spacing = 30.0;
  cfg.exportCfg.imageTemplate = "tiles/{level}/{id}.png";
  cfg.exportCfg.includePlacement = true;
  cfg.threads = 3;

  JsonValue root;
  std::string parseErr;
  ASSERT_TRUE(ParseJson(JsonStringify(AtlasConfigToJson(cfg)), root, parseErr));

  AtlasConfig back;
  AtlasError err;
  ASSERT_TRUE(ApplyAtlasConfigJson(root, back, err));
  EXPECT_TRUE(back.grid.resolutions == cfg.grid.resolutions);
  EXPECT_NEAR(back.grid.boundsMargin, 0.05, 1e-12);
  EXPECT_TRUE(back.selection.policy == SelectionPolicy::DensestSubcell);
  EXPECT_TRUE(back.selection.tieBreak == TieBreak::InputOrder);
  EXPECT_EQ(back.selection.examplesPerCell, 12);
  EXPECT_TRUE(back.density.method == DensityMethod::Percentile);
  EXPECT_NEAR(back.density.percentile, 0.95, 1e-12);
  EXPECT_NEAR(back.layout.spacing, 30.0, 1e-12);
  EXPECT_EQ(back.exportCfg.imageTemplate, cfg.exportCfg.imageTemplate);
  EXPECT_TRUE(back.exportCfg.includePlacement);
  EXPECT_EQ(back.threads, 3);

  // Merge: only the named keys change.
  AtlasConfig merged;
  ASSERT_TRUE(ParseJson("{\"layout\": {\"base_size\": 300}}", root, parseErr));
  ASSERT_TRUE(ApplyAtlasConfigJson(root, merged, err));
  EXPECT_NEAR(merged.layout.baseSize, 300.0, 1e-12);
  EXPECT_NEAR(merged.layout.minSize, 100.0, 1e-12);
  EXPECT_TRUE(merged.grid.resolutions == (std::vector<int>{64, 128, 256}));

  // Unknown keys fail and leave the target untouched.
  AtlasConfig untouched;
  ASSERT_TRUE(ParseJson("{\"grid\": {\"resolutions\": [2, 4], \"colour\": 1}}", root, parseErr));
  EXPECT_FALSE(ApplyAtlasConfigJson(root, untouched, err));
  EXPECT_TRUE(err.kind == ErrorKind::Configuration);
  EXPECT_TRUE(err.message.find("colour") != std::string::npos);
  EXPECT_TRUE(untouched.grid.resolutions == (std::vector<int>{64, 128, 256}));

  ASSERT_TRUE(ParseJson("{\"selection\": {\"policy\": \"random\"}}", root, parseErr));
  EXPECT_FALSE(ApplyAtlasConfigJson(root, untouched, err));

  const fs::path file = MakeTempPath("gridatlas_cfg");
  WriteAll(file, "{\"grid\": {\"resolutions\": [4, 16]}, \"threads\": 2}\n");
  AtlasConfig loaded;
  ASSERT_TRUE(LoadAtlasConfigJsonFile(file.string(), loaded, err));
  EXPECT_TRUE(loaded.grid.resolutions == (std::vector<int>{4, 16}));
  EXPECT_EQ(loaded.threads, 2);

  WriteAll(file, "{\"grid\": ");
  EXPECT_FALSE(LoadAtlasConfigJsonFile(file.string(), loaded, err));
  EXPECT_EQ(err.path, file.string());

  std::error_code ec;
  fs::remove(file, ec);
}

static void TestAtomicWrite()
{
  using namespace gridatlas;

  const fs::path dir = MakeTempPath("gridatlas_atomic");
  std::error_code ec;
  fs::create_directories(dir, ec);

  const fs::path target = dir / "out.json";
  AtlasError err;
  ASSERT_TRUE(WriteFileAtomic(target, "{\"a\":1}", 3, err));
  EXPECT_EQ(ReadAll(target), std::string("{\"a\":1}"));

  ASSERT_TRUE(WriteFileAtomic(target, "{}", 3, err));
  EXPECT_EQ(ReadAll(target), std::string("{}"));
  EXPECT_FALSE(fs::exists(dir / "out.json.tmp"));
  EXPECT_FALSE(fs::exists(dir / "out.json.bak"));

  // A failed commit leaves whatever occupied the target untouched.
  const fs::path occupied = dir / "occupied.json";
  fs::create_directories(occupied, ec);
  WriteAll(occupied / "keep.txt", "keep");
  EXPECT_FALSE(WriteFileAtomic(occupied, "{\"b\":2}", 2, err));
  EXPECT_TRUE(err.kind == ErrorKind::Serialization);
  EXPECT_TRUE(fs::is_directory(occupied));
  EXPECT_EQ(ReadAll(occupied / "keep.txt"), std::string("keep"));
  EXPECT_FALSE(fs::exists(dir / "occupied.json.tmp"));
  EXPECT_FALSE(fs::exists(dir / "occupied.json.bak"));

  const fs::path missing = dir / "no" / "such" / "dir" / "out.json";
  EXPECT_FALSE(WriteFileAtomic(missing, "x", 2, err));
  EXPECT_TRUE(err.kind == ErrorKind::Serialization);
  EXPECT_EQ(err.path, missing.string());
  EXPECT_FALSE(fs::exists(dir / "no" / "such" / "dir" / "out.json.tmp"));

  std::string rmErr;
  EXPECT_TRUE(RemoveFileIfExists(target, rmErr));
  EXPECT_FALSE(fs::exists(target));
  EXPECT_TRUE(RemoveFileIfExists(target, rmErr));

  fs::remove_all(dir, ec);
}

static void TestViewerDocument()
{
  using namespace gridatlas;

  const std::vector<Item> items = {MakeItem("a", 0, 0), MakeItem("b", 0, 0), MakeItem("c", 0, 0)};

  RepresentativeLevel level;
  level.resolution = 16;
  CellRepresentative twoZero;
  twoZero.cell = CellCoord{2, 0};
  twoZero.count = 1;
  twoZero.item = 2;
  twoZero.examples = {2};
  CellRepresentative tenZero;
  tenZero.cell = CellCoord{10, 0};
  tenZero.count = 2;
  tenZero.item = 0;
  tenZero.examples = {0, 1};
  level.reps = {twoZero, tenZero};

  ExportConfig cfg;
  cfg.includeExamples = true;

  std::vector<ViewerEntry> entries;
  AtlasError err;
  ASSERT_TRUE(BuildViewerEntries(items, level, nullptr, cfg, entries, err));
  ASSERT_TRUE(entries.size() == 2);
  EXPECT_EQ(entries[0].key, std::string("10,0"));
  EXPECT_EQ(entries[1].key, std::string("2,0"));

  const std::string doc = JoinViewerEntries(entries, 0, entries.size());
  EXPECT_EQ(doc.rfind("{\"10,0\":{\"count\":2,\"id\":\"a\",\"img\":\"img/a.webp\",\"url\":\"https://example.org/a\","
                      "\"caption\":\"caption a\",\"examples\":[{\"id\":\"a\",",
                      0),
            static_cast<std::size_t>(0));
  EXPECT_TRUE(doc.find("placement") == std::string::npos);

  JsonValue root;
  std::string parseErr;
  ASSERT_TRUE(ParseJson(doc, root, parseErr));
  const JsonValue* cell = FindJsonMember(root, "10,0");
  ASSERT_TRUE(cell && cell->isObject());
  const JsonValue* examples = FindJsonMember(*cell, "examples");
  ASSERT_TRUE(examples && examples->isArray() && examples->arrayValue.size() == 2);
  const JsonValue* secondId = FindJsonMember(examples->arrayValue[1], "id");
  ASSERT_TRUE(secondId && secondId->isString());
  EXPECT_EQ(secondId->stringValue, std::string("b"));

  // Placements and image template.
  LayoutResult layout;
  layout.resolution = 16;
  Placement p2;
  p2.item = 2;
  p2.cell = CellCoord{2, 0};
  p2.x = -3150.0;
  p2.y = -3375.0;
  p2.size = 250.0;
  Placement p10 = p2;
  p10.item = 0;
  p10.cell = CellCoord{10, 0};
  p10.x = 450.0;
  layout.placements = {p2, p10};

  cfg.includeExamples = false;
  cfg.includePlacement = true;
  cfg.imageTemplate = "tiles/{level}/{col}_{row}.png";
  ASSERT_TRUE(BuildViewerEntries(items, level, &layout, cfg, entries, err));
  EXPECT_EQ(entries[1].json, std::string("{\"count\":1,\"id\":\"c\",\"img\":\"tiles/16/2_0.png\","
                                         "\"url\":\"https://example.org/c\",\"caption\":\"caption c\","
                                         "\"placement\":{\"x\":-3150,\"y\":-3375,\"size\":250}}"));

  EXPECT_EQ(JoinViewerEntries({}, 0, 0), std::string("{}"));
}

static void TestImageTemplate()
{
  using namespace gridatlas;

  EXPECT_EQ(ExpandImageTemplate("tiles/{level}/{col}_{row}/{id}.png", 64, CellCoord{3, 5}, "x1", "fb"),
            std::string("tiles/64/3_5/x1.png"));
  EXPECT_EQ(ExpandImageTemplate("", 64, CellCoord{3, 5}, "x1", "fb"), std::string("fb"));
  EXPECT_EQ(ExpandImageTemplate("{foo}/{id}", 1, CellCoord{}, "q", ""), std::string("{foo}/q"));
  EXPECT_EQ(ExpandImageTemplate("a/{level", 2, CellCoord{}, "q", ""), std::string("a/{level"));
}

static void TestLeafImageTemplate()
{
  using namespace gridatlas;

  const std::vector<Item> items = {MakeItem("a", 0.0, 0.0), MakeItem("b", 3.0, 3.0)};
  AtlasConfig cfg;
  cfg.grid.resolutions = {1, 4};
  cfg.threads = 1;
  cfg.exportCfg.imageTemplate = "img/{level}/{col}_{row}.webp";

  AtlasResult atlas;
  AtlasError err;
  ASSERT_TRUE(BuildAtlas(items, cfg, atlas, err));
  ASSERT_TRUE(atlas.representatives.size() == 2);

  // The single coarse cell names the finest cell of its representative "a".
  std::vector<ViewerEntry> entries;
  ASSERT_TRUE(BuildViewerEntries(items, atlas.representatives[0], nullptr, cfg.exportCfg, entries, err));
  ASSERT_TRUE(entries.size() == 1);
  EXPECT_TRUE(entries[0].json.find("\"img\":\"img/4/0_0.webp\"") != std::string::npos);

  ASSERT_TRUE(BuildViewerEntries(items, atlas.representatives[1], nullptr, cfg.exportCfg, entries, err));
  ASSERT_TRUE(entries.size() == 2);
  EXPECT_EQ(entries[1].key, std::string("3,3"));
  EXPECT_TRUE(entries[1].json.find("\"img\":\"img/4/3_3.webp\"") != std::string::npos);

  LayoutResult layout;
  ASSERT_TRUE(BuildLevelLayout(atlas, 1, cfg.layout, layout, err));
  EXPECT_EQ(layout.leafResolution, 4);
  const std::string csv = BuildBoardCsv(items, layout, cfg.layout, cfg.exportCfg, BoardOptions{});
  EXPECT_TRUE(csv.find(",img/4/0_0.webp,") != std::string::npos);
}

static void TestSplitDocument()
{
  using namespace gridatlas;

  std::vector<ViewerEntry> entries;
  for (int k = 0; k < 40; ++k) {
    ViewerEntry e;
    e.key = std::to_string(k) + ",0";
    e.json = "{\"count\":" + std::to_string(k + 1) + "}";
    entries.push_back(e);
  }
  std::sort(entries.begin(), entries.end(), [](const ViewerEntry& a, const ViewerEntry& b) { return a.key < b.key; });

  const std::string full = JoinViewerEntries(entries, 0, entries.size());
  EXPECT_EQ(SplitViewerDocument(entries, full.size()).size(), static_cast<std::size_t>(1));

  const std::uint64_t maxBytes = full.size() / 3 + 1;
  const std::vector<std::string> parts = SplitViewerDocument(entries, maxBytes);
  ASSERT_TRUE(parts.size() == 3);

  std::vector<std::string> keys;
  for (const std::string& part : parts) {
    JsonValue v;
    std::string parseErr;
    ASSERT_TRUE(ParseJson(part, v, parseErr));
    ASSERT_TRUE(v.isObject());
    EXPECT_TRUE(v.objectValue.size() >= 13 && v.objectValue.size() <= 14);
    for (const auto& kv : v.objectValue) keys.push_back(kv.first);
  }
  ASSERT_TRUE(keys.size() == entries.size());
  for (std::size_t i = 0; i < keys.size(); ++i) EXPECT_EQ(keys[i], entries[i].key);

  // Never more parts than entries.
  EXPECT_EQ(SplitViewerDocument(entries, 1).size(), entries.size());
}

static bool ExportAll(const fs::path& dir, const std::vector<gridatlas::Item>& items,
                      const gridatlas::AtlasResult& atlas, const gridatlas::AtlasConfig& cfg,
                      gridatlas::ExportResult& out)
{
  gridatlas::AtlasError err;
  if (!gridatlas::ExportAtlasViewer(dir.string(), items, atlas, cfg, {}, out, err)) {
    std::cerr << gridatlas::FormatAtlasError(err) << "\n";
    return false;
  }
  return true;
}

static void TestExportFilesAndStaleCleanup()
{
  using namespace gridatlas;

  const std::vector<Item> items = GridItems(12);
  AtlasConfig cfg;
  cfg.grid.resolutions = {2, 8};
  cfg.exportCfg.includePlacement = true;

  AtlasResult atlas;
  AtlasError err;
  ASSERT_TRUE(BuildAtlas(items, cfg, atlas, err));

  const fs::path dir = MakeTempPath("gridatlas_export");
  ExportResult first;
  ASSERT_TRUE(ExportAll(dir, items, atlas, cfg, first));
  EXPECT_EQ(first.files.size(), static_cast<std::size_t>(2));
  EXPECT_TRUE(fs::exists(dir / "grid_2.json"));
  EXPECT_TRUE(fs::exists(dir / "grid_8.json"));

  JsonValue doc;
  std::string parseErr;
  ASSERT_TRUE(ParseJson(ReadAll(dir / "grid_8.json"), doc, parseErr));
  EXPECT_EQ(doc.objectValue.size(), atlas.representatives.back().reps.size());

  // Same inputs, same bytes.
  const fs::path dir2 = MakeTempPath("gridatlas_export");
  ExportResult second;
  ASSERT_TRUE(ExportAll(dir2, items, atlas, cfg, second));
  EXPECT_EQ(first.hash, second.hash);
  EXPECT_EQ(ReadAll(dir / "grid_8.json"), ReadAll(dir2 / "grid_8.json"));

  // Shrinking the size limit switches grid_8 to parts and removes grid_8.json.
  AtlasConfig tight = cfg;
  tight.exportCfg.maxFileBytes = 600;
  ExportResult split;
  ASSERT_TRUE(ExportViewerLevel(dir.string(), items, atlas.representatives.back(), nullptr, tight.exportCfg, split,
                                err));
  EXPECT_TRUE(split.files.size() > 1);
  EXPECT_FALSE(fs::exists(dir / "grid_8.json"));
  EXPECT_TRUE(fs::exists(dir / "grid_8_part1.json"));
  EXPECT_TRUE(fs::exists(dir / "grid_2.json"));

  // And back again: the parts go away.
  ExportResult whole;
  ASSERT_TRUE(ExportViewerLevel(dir.string(), items, atlas.representatives.back(), nullptr, cfg.exportCfg, whole,
                                err));
  EXPECT_TRUE(fs::exists(dir / "grid_8.json"));
  EXPECT_FALSE(fs::exists(dir / "grid_8_part1.json"));
  EXPECT_FALSE(fs::exists(dir / "grid_8_part2.json"));

  // Unknown resolution requested for export.
  EXPECT_FALSE(ExportAtlasViewer(dir.string(), items, atlas, cfg, {4}, whole, err));
  EXPECT_TRUE(err.kind == ErrorKind::Configuration);

  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::remove_all(dir2, ec);
}

static void TestBoardExport()
{
  using namespace gridatlas;

  std::vector<Item> items = {MakeItem("a", 0, 0), MakeItem("b", 0, 0), MakeItem("c", 0, 0)};
  items[1].meta.caption = "says \"hi\", twice";

  LayoutConfig layoutCfg;
  std::vector<LayoutInput> inputs;
  inputs.push_back(LayoutInput{0, CellCoord{0, 0}, 1.0});
  inputs.push_back(LayoutInput{1, CellCoord{1, 0}, 0.0});
  inputs.push_back(LayoutInput{2, CellCoord{1, 1}, 0.5});

  LayoutResult layout;
  AtlasError err;
  ASSERT_TRUE(ComputeLayout(inputs, 2, layoutCfg, layout, err));

  ExportConfig cfg;
  BoardOptions opt;
  std::string json;
  ASSERT_TRUE(BuildBoardJson(items, layout, layoutCfg, cfg, opt, json, err));
  EXPECT_EQ(json.back(), '\n');

  JsonValue root;
  std::string parseErr;
  ASSERT_TRUE(ParseJson(json, root, parseErr));
  const JsonValue* count = FindJsonMember(root, "count");
  ASSERT_TRUE(count && count->isNumber());
  EXPECT_NEAR(count->numberValue, 3.0, 0.0);
  const JsonValue* pitch = FindJsonMember(root, "pitch");
  ASSERT_TRUE(pitch && pitch->isNumber());
  EXPECT_NEAR(pitch->numberValue, 450.0, 1e-12);

  const JsonValue* placements = FindJsonMember(root, "placements");
  ASSERT_TRUE(placements && placements->isArray() && placements->arrayValue.size() == 3);
  const JsonValue& first = placements->arrayValue[0];
  const JsonValue* x = FindJsonMember(first, "x");
  ASSERT_TRUE(x && x->isNumber());
  EXPECT_NEAR(x->numberValue, -225.0, 1e-9);
  const JsonValue* caption = FindJsonMember(first, "caption");
  ASSERT_TRUE(caption && caption->isObject());
  const JsonValue* capY = FindJsonMember(*caption, "y");
  ASSERT_TRUE(capY && capY->isNumber());
  EXPECT_NEAR(capY->numberValue, -225.0 + 200.0 + 20.0, 1e-9);

  opt.limit = 2;
  ASSERT_TRUE(BuildBoardJson(items, layout, layoutCfg, cfg, opt, json, err));
  ASSERT_TRUE(ParseJson(json, root, parseErr));
  placements = FindJsonMember(root, "placements");
  ASSERT_TRUE(placements && placements->arrayValue.size() == 2);

  const std::string csv = BuildBoardCsv(items, layout, layoutCfg, cfg, opt);
  EXPECT_EQ(csv.rfind("id,x,y,size,img,url,title\n", 0), static_cast<std::size_t>(0));
  EXPECT_TRUE(csv.find("a,-225,-225,400,img/a.webp,https://example.org/a,caption a\n") != std::string::npos);
  EXPECT_TRUE(csv.find("\"says \"\"hi\"\", twice\"") != std::string::npos);
  EXPECT_TRUE(csv.find("\nc,") == std::string::npos);

  EXPECT_EQ(CsvEscape("plain"), std::string("plain"));
  EXPECT_EQ(CsvEscape("a,b"), std::string("\"a,b\""));

  const fs::path dir = MakeTempPath("gridatlas_board");
  ExportResult out;
  ASSERT_TRUE(ExportBoard((dir / "board.json").string(), (dir / "sub" / "board.csv").string(), items, layout,
                          layoutCfg, cfg, opt, out, err));
  EXPECT_EQ(out.files.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(ReadAll(dir / "sub" / "board.csv"), csv);

  std::error_code ec;
  fs::remove_all(dir, ec);
}

static int RunCli(const std::vector<std::string>& args)
{
  std::vector<std::string> storage;
  storage.push_back("gridatlas");
  storage.insert(storage.end(), args.begin(), args.end());

  std::vector<char*> argv;
  for (std::string& s : storage) argv.push_back(s.data());
  argv.push_back(nullptr);
  return gridatlas::GridAtlasCliMain(static_cast<int>(storage.size()), argv.data());
}

static void TestCliEndToEnd()
{
  using namespace gridatlas;

  const fs::path dir = MakeTempPath("gridatlas_cli");
  std::error_code ec;
  fs::create_directories(dir, ec);

  const fs::path input = dir / "items.csv";
  {
    std::ostringstream oss;
    oss << "id,x,y,caption,url,image\n";
    for (int k = 0; k < 64; ++k) {
      oss << "p" << k << "," << (k % 8) << "," << (k / 8) << ",item " << k << ",https://example.org/" << k
          << ",img/" << k << ".webp\n";
    }
    oss << "broken,,1,missing x,,\n";
    WriteAll(input, oss.str());
  }

  const fs::path out = dir / "atlas";
  const fs::path board = dir / "board.json";
  const fs::path log = dir / "logs" / "run.log";
  EXPECT_EQ(RunCli({"--input", input.string(), "--levels", "2,4", "--out-dir", out.string(), "--board",
                    board.string(), "--board-level", "4", "--placement", "1", "--verify", "--log", log.string(),
                    "--quiet"}),
            0);
  EXPECT_TRUE(fs::exists(out / "grid_2.json"));
  EXPECT_TRUE(fs::exists(out / "grid_4.json"));
  EXPECT_TRUE(fs::exists(board));
  EXPECT_TRUE(fs::exists(log));

  JsonValue doc;
  std::string parseErr;
  ASSERT_TRUE(gridatlas::ParseJson(ReadAll(out / "grid_4.json"), doc, parseErr));
  EXPECT_EQ(doc.objectValue.size(), static_cast<std::size_t>(16));

  // Flags override the config file.
  const fs::path cfgFile = dir / "cfg.json";
  WriteAll(cfgFile, "{\"grid\": {\"resolutions\": [64, 100]}}");
  EXPECT_EQ(RunCli({"--config", cfgFile.string(), "--input", input.string(), "--quiet"}), 2);
  EXPECT_EQ(RunCli({"--config", cfgFile.string(), "--levels", "1,2", "--input", input.string(), "--out-dir",
                    (dir / "cfg_out").string(), "--quiet"}),
            0);
  EXPECT_TRUE(fs::exists(dir / "cfg_out" / "grid_1.json"));

  const fs::path dumped = dir / "dump" / "config.json";
  EXPECT_EQ(RunCli({"--levels", "8,16", "--dump-config", dumped.string(), "--quiet"}), 0);
  gridatlas::AtlasConfig reloaded;
  gridatlas::AtlasError err;
  EXPECT_TRUE(gridatlas::LoadAtlasConfigJsonFile(dumped.string(), reloaded, err));
  EXPECT_TRUE(reloaded.grid.resolutions == (std::vector<int>{8, 16}));

  EXPECT_EQ(RunCli({"--input", input.string(), "--levels", "64,100", "--quiet"}), 2);
  EXPECT_EQ(RunCli({"--input", input.string(), "--levels", "abc", "--quiet"}), 2);
  EXPECT_EQ(RunCli({"--input", input.string(), "--no-such-flag"}), 2);
  EXPECT_EQ(RunCli({"--quiet"}), 2);
  EXPECT_EQ(RunCli({"--input", (dir / "missing.csv").string(), "--quiet"}), 1);

  // Unknown output levels are configuration errors raised before anything is written.
  const fs::path badBoardOut = dir / "bad_board_out";
  EXPECT_EQ(RunCli({"--input", input.string(), "--levels", "2,4", "--out-dir", badBoardOut.string(), "--board",
                    (dir / "bad_board.json").string(), "--board-level", "3", "--quiet"}),
            2);
  EXPECT_FALSE(fs::exists(badBoardOut / "grid_2.json"));
  EXPECT_FALSE(fs::exists(badBoardOut / "grid_4.json"));
  EXPECT_FALSE(fs::exists(dir / "bad_board.json"));

  const fs::path badLevelOut = dir / "bad_level_out";
  EXPECT_EQ(RunCli({"--input", input.string(), "--levels", "2,4", "--out-dir", badLevelOut.string(), "--level",
                    "2", "--level", "8", "--quiet"}),
            2);
  EXPECT_FALSE(fs::exists(badLevelOut / "grid_2.json"));
  EXPECT_EQ(RunCli({"--version"}), 0);

  fs::remove_all(dir, ec);
}

int main()
{
  TestJsonBasics();
  TestCsvIngestion();
  TestCsvInvalidRows();
  TestJsonLinesIngestion();
  TestConfigJson();
  TestAtomicWrite();
  TestViewerDocument();
  TestImageTemplate();
  TestLeafImageTemplate();
  TestSplitDocument();
  TestExportFilesAndStaleCleanup();
  TestBoardExport();
  TestCliEndToEnd();

  if (g_failures == 0) {
    std::cout << "gridatlas_export_tests: OK\n";
    return 0;
  }

  std::cerr << "gridatlas_export_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
