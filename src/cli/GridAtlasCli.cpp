// gridatlas
//
// Thin command line wrapper around gridatlas_core: load a projected item
// table, build the multi-resolution atlas and write the viewer documents and
// (optionally) the board placement list.

#include "cli/CliMain.hpp"
#include "cli/CliParse.hpp"

#include "gridatlas/Atlas.hpp"
#include "gridatlas/ConfigIO.hpp"
#include "gridatlas/FileSync.hpp"
#include "gridatlas/ItemTable.hpp"
#include "gridatlas/Json.hpp"
#include "gridatlas/LogTee.hpp"
#include "gridatlas/Version.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace gridatlas {

namespace {

using cli::HexU64;
using cli::ParseBool01;
using cli::ParseF64;
using cli::ParseI32;
using cli::ParseResolutionList;

void PrintHelp()
{
  std::cout
      << "gridatlas (multi-resolution spatial atlas builder)\n\n"
      << "Bins a table of 2D-projected items into nested N x N grids, picks one representative per\n"
      << "populated cell, scores density and writes one JSON document per resolution.\n\n"
      << "Usage:\n"
      << "  gridatlas --input <items.csv|items.jsonl> [options]\n\n"
      << "Input:\n"
      << "  --input <path>           Item table (.csv with header, or .jsonl/.ndjson).\n"
      << "  --id-col <name>          Identifier column (default: id).\n"
      << "  --x-col <name>           X coordinate column (default: x).\n"
      << "  --y-col <name>           Y coordinate column (default: y).\n"
      << "  --caption-col <name>     Caption column (default: caption).\n"
      << "  --url-col <name>         URL column (default: url).\n"
      << "  --image-col <name>       Image reference column (default: image).\n"
      << "\nConfiguration:\n"
      << "  --config <cfg.json>      Load configuration (flags below override it).\n"
      << "  --dump-config <out.json> Write the effective configuration.\n"
      << "  --levels <list>          Resolutions, e.g. 64,128,256 (each must divide the finest).\n"
      << "  --margin <F>             Bounds padding as a fraction of the extent (default: 0).\n"
      << "  --policy <name>          center|densest_subcell|child_max_count (default: center).\n"
      << "  --tie-break <name>       lowest_id|input_order (default: lowest_id).\n"
      << "  --density <name>         linear|log|percentile (default: log).\n"
      << "  --percentile <F>         Clip percentile in (0,1] for --density percentile (default: 0.99).\n"
      << "  --density-level <N>      Reference resolution for item density (default: finest).\n"
      << "  --base-size <F>          Size of the densest placement (default: 400).\n"
      << "  --min-size <F>           Size floor (default: 100).\n"
      << "  --spacing <F>            Minimum gap between placements (default: 50).\n"
      << "  --pitch <F>              Cell pitch on the board (default: base-size + spacing).\n"
      << "  --threads <N>            Worker threads (default: 0 = hardware concurrency).\n"
      << "\nOutputs:\n"
      << "  --out-dir <dir>          Viewer documents directory (default: atlas).\n"
      << "  --level <N>              Export only this resolution (repeatable).\n"
      << "  --examples <N>           Example items per cell (default: 100, 0 disables).\n"
      << "  --placement <0|1>        Include board placements in viewer documents (default: 0).\n"
      << "  --image-template <S>     Image template; {level} {col} {row} name the finest cell, plus {id}.\n"
      << "  --max-json-mb <F>        Split documents larger than this (default: 50).\n"
      << "  --board <out.json>       Write board placements as JSON.\n"
      << "  --board-csv <out.csv>    Write board placements as CSV.\n"
      << "  --board-level <N>        Resolution for the board (default: finest).\n"
      << "  --limit <N>              Export at most N board placements (default: 0 = all).\n"
      << "\nMisc:\n"
      << "  --verify                 Re-check every atlas invariant before exporting.\n"
      << "  --log <file>             Tee stdout/stderr into a rotated log file.\n"
      << "  --quiet                  Suppress progress output.\n"
      << "  --version                Print the version and exit.\n"
      << "\nExit codes: 0 success, 1 runtime failure, 2 usage or configuration error.\n";
}

int ExitCodeFor(const AtlasError& err) { return err.kind == ErrorKind::Configuration ? 2 : 1; }

int Fail(const AtlasError& err)
{
  std::cerr << FormatAtlasError(err) << "\n";
  return ExitCodeFor(err);
}

} // namespace

int GridAtlasCliMain(int argc, char** argv)
{
  std::string inputPath;
  std::string configPath;
  std::string dumpConfigPath;
  std::string outDir = "atlas";
  std::string boardPath;
  std::string boardCsvPath;
  std::string logPath;
  std::vector<int> exportLevels;
  int boardLevel = 0;
  bool verify = false;
  bool quiet = false;

  ItemTableOptions tableOpt;
  BoardOptions boardOpt;

  // --config is applied first so that flags always override the file.
  for (int i = 1; i + 1 < argc; ++i) {
    if (argv[i] && std::string(argv[i]) == "--config") configPath = argv[i + 1] ? argv[i + 1] : "";
  }

  AtlasConfig cfg;
  if (!configPath.empty()) {
    AtlasError err;
    if (!LoadAtlasConfigJsonFile(configPath, cfg, err)) return Fail(err);
  }

  bool usageError = false;
  auto requireArg = [&](int& i, const std::string& opt, std::string& out) -> bool {
    if (i + 1 >= argc) {
      std::cerr << opt << " requires a value\n";
      usageError = true;
      return false;
    }
    out = argv[++i] ? std::string(argv[i]) : std::string();
    return true;
  };
  auto invalid = [&](const std::string& opt, const std::string& v) {
    std::cerr << "invalid " << opt << ": " << v << "\n";
    usageError = true;
  };

  for (int i = 1; i < argc && !usageError; ++i) {
    const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
    std::string v;

    if (arg == "-h" || arg == "--help") {
      PrintHelp();
      return 0;
    }
    if (arg == "--version") {
      std::cout << "gridatlas " << GridAtlasFullVersionString() << "\n";
      return 0;
    }
    if (arg == "--quiet") {
      quiet = true;
    } else if (arg == "--verify") {
      verify = true;
    } else if (arg == "--config") {
      requireArg(i, arg, v);
    } else if (arg == "--input") {
      requireArg(i, arg, inputPath);
    } else if (arg == "--id-col") {
      requireArg(i, arg, tableOpt.columns.id);
    } else if (arg == "--x-col") {
      requireArg(i, arg, tableOpt.columns.x);
    } else if (arg == "--y-col") {
      requireArg(i, arg, tableOpt.columns.y);
    } else if (arg == "--caption-col") {
      requireArg(i, arg, tableOpt.columns.caption);
    } else if (arg == "--url-col") {
      requireArg(i, arg, tableOpt.columns.url);
    } else if (arg == "--image-col") {
      requireArg(i, arg, tableOpt.columns.image);
    } else if (arg == "--dump-config") {
      requireArg(i, arg, dumpConfigPath);
    } else if (arg == "--out-dir") {
      requireArg(i, arg, outDir);
    } else if (arg == "--board") {
      requireArg(i, arg, boardPath);
    } else if (arg == "--board-csv") {
      requireArg(i, arg, boardCsvPath);
    } else if (arg == "--log") {
      requireArg(i, arg, logPath);
    } else if (arg == "--image-template") {
      requireArg(i, arg, cfg.exportCfg.imageTemplate);
    } else if (arg == "--levels") {
      if (requireArg(i, arg, v) && !ParseResolutionList(v, &cfg.grid.resolutions)) invalid(arg, v);
    } else if (arg == "--level") {
      int n = 0;
      if (requireArg(i, arg, v) && (!ParseI32(v, &n) || n <= 0)) invalid(arg, v);
      else exportLevels.push_back(n);
    } else if (arg == "--board-level") {
      if (requireArg(i, arg, v) && (!ParseI32(v, &boardLevel) || boardLevel <= 0)) invalid(arg, v);
    } else if (arg == "--limit") {
      if (requireArg(i, arg, v) && (!ParseI32(v, &boardOpt.limit) || boardOpt.limit < 0)) invalid(arg, v);
    } else if (arg == "--threads") {
      if (requireArg(i, arg, v) && !ParseI32(v, &cfg.threads)) invalid(arg, v);
    } else if (arg == "--examples") {
      int n = 0;
      if (requireArg(i, arg, v) && (!ParseI32(v, &n) || n < 0)) {
        invalid(arg, v);
      } else {
        cfg.selection.examplesPerCell = n;
        cfg.exportCfg.includeExamples = n > 0;
      }
    } else if (arg == "--placement") {
      if (requireArg(i, arg, v) && !ParseBool01(v, &cfg.exportCfg.includePlacement)) invalid(arg, v);
    } else if (arg == "--margin") {
      if (requireArg(i, arg, v) && !ParseF64(v, &cfg.grid.boundsMargin)) invalid(arg, v);
    } else if (arg == "--policy") {
      if (requireArg(i, arg, v) && !ParseSelectionPolicy(v, cfg.selection.policy)) invalid(arg, v);
    } else if (arg == "--tie-break") {
      if (requireArg(i, arg, v) && !ParseTieBreak(v, cfg.selection.tieBreak)) invalid(arg, v);
    } else if (arg == "--density") {
      if (requireArg(i, arg, v) && !ParseDensityMethod(v, cfg.density.method)) invalid(arg, v);
    } else if (arg == "--percentile") {
      if (requireArg(i, arg, v) && !ParseF64(v, &cfg.density.percentile)) invalid(arg, v);
    } else if (arg == "--density-level") {
      if (requireArg(i, arg, v) && !ParseI32(v, &cfg.density.referenceResolution)) invalid(arg, v);
    } else if (arg == "--base-size") {
      if (requireArg(i, arg, v) && !ParseF64(v, &cfg.layout.baseSize)) invalid(arg, v);
    } else if (arg == "--min-size") {
      if (requireArg(i, arg, v) && !ParseF64(v, &cfg.layout.minSize)) invalid(arg, v);
    } else if (arg == "--spacing") {
      if (requireArg(i, arg, v) && !ParseF64(v, &cfg.layout.spacing)) invalid(arg, v);
    } else if (arg == "--pitch") {
      if (requireArg(i, arg, v) && !ParseF64(v, &cfg.layout.cellPitch)) invalid(arg, v);
    } else if (arg == "--max-json-mb") {
      double mb = 0.0;
      if (requireArg(i, arg, v) && (!ParseF64(v, &mb) || !(mb > 0.0))) {
        invalid(arg, v);
      } else {
        cfg.exportCfg.maxFileBytes = static_cast<std::uint64_t>(mb * 1024.0 * 1024.0);
      }
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      usageError = true;
    }
  }
  if (usageError) {
    std::cerr << "run with --help for usage\n";
    return 2;
  }

  LogTee logTee;
  if (!logPath.empty()) {
    LogTeeOptions lopt;
    lopt.path = logPath;
    std::string logErr;
    if (!logTee.start(lopt, logErr)) {
      std::cerr << "unable to start log: " << logErr << "\n";
      return 1;
    }
  }

  AtlasError err;
  if (!ValidateAtlasConfig(cfg, err)) return Fail(err);

  // Output levels must be resolved before any work so a bad flag writes nothing.
  auto requireConfigured = [&](int n, const char* opt) -> bool {
    const std::vector<int>& res = cfg.grid.resolutions;
    if (std::find(res.begin(), res.end(), n) != res.end()) return true;
    FailConfig(err, std::string(opt) + " " + std::to_string(n) + " is not a configured resolution");
    err.resolution = n;
    return false;
  };
  for (int n : exportLevels) {
    if (!requireConfigured(n, "--level")) return Fail(err);
  }
  if (boardLevel > 0 && !requireConfigured(boardLevel, "--board-level")) return Fail(err);

  if (!dumpConfigPath.empty()) {
    const std::string text = JsonStringify(AtlasConfigToJson(cfg));
    if (!cli::EnsureParentDir(dumpConfigPath)) {
      FailSerialization(err, "unable to create parent directory", dumpConfigPath);
      return Fail(err);
    }
    if (!WriteFileAtomic(dumpConfigPath, text, cfg.exportCfg.writeRetries, err)) return Fail(err);
    if (!quiet) std::cout << "wrote config " << dumpConfigPath << "\n";
  }

  if (inputPath.empty()) {
    if (!dumpConfigPath.empty()) return 0;
    std::cerr << "--input is required (run with --help for usage)\n";
    return 2;
  }

  ItemTable table;
  if (!LoadItemTable(inputPath, tableOpt, table, err)) return Fail(err);
  for (const AtlasWarning& w : table.warnings) std::cerr << FormatAtlasWarning(w) << "\n";
  if (!quiet) {
    std::cout << "loaded " << table.items.size() << " items from " << inputPath << " (" << table.rowsRead
              << " rows, " << table.rowsRejected << " rejected)\n";
  }

  AtlasResult atlas;
  if (!BuildAtlas(table.items, cfg, atlas, err)) return Fail(err);
  for (const AtlasWarning& w : atlas.warnings) std::cerr << FormatAtlasWarning(w) << "\n";

  if (!quiet) {
    for (std::size_t li = 0; li < atlas.hierarchy.levels.size(); ++li) {
      const GridLevel& level = atlas.hierarchy.levels[li];
      std::size_t maxCount = 0;
      for (const GridCell& c : level.cells) maxCount = std::max(maxCount, c.items.size());
      std::cout << "  " << level.resolution << "x" << level.resolution << ": " << level.cells.size()
                << " populated cells, max " << maxCount << " items/cell\n";
    }
    std::cout << "  density: " << DensityMethodName(cfg.density.method) << " at " << atlas.density.resolution
              << " (max " << atlas.density.maxCount << ", clip " << atlas.density.clipCount << ")\n";
  }

  if (verify) {
    std::string why;
    if (!VerifyAtlas(atlas, cfg, why)) {
      std::cerr << "verification failed: " << why << "\n";
      return 1;
    }
    if (!quiet) std::cout << "  verify: OK\n";
  }

  ExportResult exported;
  if (!ExportAtlasViewer(outDir, table.items, atlas, cfg, exportLevels, exported, err)) return Fail(err);

  if (!boardPath.empty() || !boardCsvPath.empty()) {
    const int level = boardLevel > 0 ? boardLevel : FinestResolution(cfg.grid);
    LayoutResult layout;
    if (!BuildLevelLayout(atlas, level, cfg.layout, layout, err)) return Fail(err);
    if (!ExportBoard(boardPath, boardCsvPath, table.items, layout, cfg.layout, cfg.exportCfg, boardOpt, exported,
                     err)) {
      return Fail(err);
    }
    if (!quiet && layout.shrunkCount > 0) {
      std::cout << "  board: " << layout.shrunkCount << " placements capped at pitch - spacing\n";
    }
  }

  if (!quiet) {
    for (const ExportedFile& f : exported.files) {
      std::cout << "wrote " << f.path << " (" << f.bytes << " bytes, " << HexU64(f.hash) << ")\n";
    }
    std::cout << "output hash: " << HexU64(exported.hash) << "\n";
  }
  return 0;
}

} // namespace gridatlas
