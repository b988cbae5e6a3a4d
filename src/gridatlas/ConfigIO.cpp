#include "gridatlas/ConfigIO.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <sstream>

namespace gridatlas {

namespace {

static bool CheckKeys(const JsonValue& obj, const char* section, std::initializer_list<const char*> known,
                      std::string& err)
{
  for (const auto& kv : obj.objectValue) {
    bool found = false;
    for (const char* k : known) {
      if (kv.first == k) {
        found = true;
        break;
      }
    }
    if (!found) {
      err = std::string("unknown key '") + kv.first + "' in " + section;
      return false;
    }
  }
  return true;
}

static bool ApplyBool(const JsonValue& root, const char* key, bool& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true; // missing => keep
  if (!v->isBool()) {
    err = std::string("expected boolean for key '") + key + "'";
    return false;
  }
  io = v->boolValue;
  return true;
}

static bool ApplyF64(const JsonValue& root, const char* key, double& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber() || !std::isfinite(v->numberValue)) {
    err = std::string("expected finite number for key '") + key + "'";
    return false;
  }
  io = v->numberValue;
  return true;
}

static bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  double d = static_cast<double>(io);
  if (!ApplyF64(root, key, d, err)) return false;
  if (d != std::floor(d) || d < static_cast<double>(std::numeric_limits<int>::min()) ||
      d > static_cast<double>(std::numeric_limits<int>::max())) {
    err = std::string("expected integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(d);
  return true;
}

static bool ApplyU64(const JsonValue& root, const char* key, std::uint64_t& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  // 2^53 keeps the value exact in a double.
  if (!v->isNumber() || v->numberValue < 0.0 || v->numberValue > 9007199254740992.0 ||
      v->numberValue != std::floor(v->numberValue)) {
    err = std::string("expected non-negative integer for key '") + key + "'";
    return false;
  }
  io = static_cast<std::uint64_t>(v->numberValue);
  return true;
}

static bool ApplyString(const JsonValue& root, const char* key, std::string& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isString()) {
    err = std::string("expected string for key '") + key + "'";
    return false;
  }
  io = v->stringValue;
  return true;
}

template <typename Enum, typename ParseFn>
static bool ApplyEnum(const JsonValue& root, const char* key, Enum& io, ParseFn parse, std::string& err)
{
  std::string name;
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!ApplyString(root, key, name, err)) return false;
  if (!parse(name, io)) {
    err = std::string("unknown value '") + name + "' for key '" + key + "'";
    return false;
  }
  return true;
}

static const JsonValue* Section(const JsonValue& root, const char* key, std::string& err, bool& ok)
{
  ok = true;
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return nullptr;
  if (!v->isObject()) {
    err = std::string("expected object for section '") + key + "'";
    ok = false;
    return nullptr;
  }
  return v;
}

static bool ApplyGrid(const JsonValue& o, GridConfig& g, std::string& err)
{
  if (!CheckKeys(o, "grid", {"resolutions", "bounds_margin"}, err)) return false;

  if (const JsonValue* r = FindJsonMember(o, "resolutions")) {
    if (!r->isArray()) {
      err = "expected array for key 'resolutions'";
      return false;
    }
    std::vector<int> res;
    for (const JsonValue& e : r->arrayValue) {
      if (!e.isNumber() || e.numberValue != std::floor(e.numberValue) || e.numberValue < 1.0 ||
          e.numberValue > static_cast<double>(std::numeric_limits<int>::max())) {
        err = "resolutions must be positive integers";
        return false;
      }
      res.push_back(static_cast<int>(e.numberValue));
    }
    g.resolutions = std::move(res);
  }
  return ApplyF64(o, "bounds_margin", g.boundsMargin, err);
}

static bool ApplySelection(const JsonValue& o, SelectionConfig& s, std::string& err)
{
  if (!CheckKeys(o, "selection",
                 {"policy", "tie_break", "dense_cell_threshold", "sub_grid_size", "examples_per_cell"}, err)) {
    return false;
  }
  return ApplyEnum(o, "policy", s.policy, ParseSelectionPolicy, err) &&
         ApplyEnum(o, "tie_break", s.tieBreak, ParseTieBreak, err) &&
         ApplyI32(o, "dense_cell_threshold", s.denseCellThreshold, err) &&
         ApplyI32(o, "sub_grid_size", s.subGridSize, err) &&
         ApplyI32(o, "examples_per_cell", s.examplesPerCell, err);
}

static bool ApplyDensity(const JsonValue& o, DensityConfig& d, std::string& err)
{
  if (!CheckKeys(o, "density", {"method", "percentile", "reference_resolution"}, err)) return false;
  return ApplyEnum(o, "method", d.method, ParseDensityMethod, err) &&
         ApplyF64(o, "percentile", d.percentile, err) &&
         ApplyI32(o, "reference_resolution", d.referenceResolution, err);
}

static bool ApplyLayout(const JsonValue& o, LayoutConfig& l, std::string& err)
{
  if (!CheckKeys(o, "layout",
                 {"base_size", "min_size", "spacing", "cell_pitch", "caption_offset", "caption_max_chars"}, err)) {
    return false;
  }
  return ApplyF64(o, "base_size", l.baseSize, err) && ApplyF64(o, "min_size", l.minSize, err) &&
         ApplyF64(o, "spacing", l.spacing, err) && ApplyF64(o, "cell_pitch", l.cellPitch, err) &&
         ApplyF64(o, "caption_offset", l.captionOffset, err) &&
         ApplyI32(o, "caption_max_chars", l.captionMaxChars, err);
}

static bool ApplyExport(const JsonValue& o, ExportConfig& e, std::string& err)
{
  if (!CheckKeys(o, "export",
                 {"include_examples", "include_placement", "image_template", "max_file_bytes", "write_retries"},
                 err)) {
    return false;
  }
  return ApplyBool(o, "include_examples", e.includeExamples, err) &&
         ApplyBool(o, "include_placement", e.includePlacement, err) &&
         ApplyString(o, "image_template", e.imageTemplate, err) &&
         ApplyU64(o, "max_file_bytes", e.maxFileBytes, err) &&
         ApplyI32(o, "write_retries", e.writeRetries, err);
}

} // namespace

JsonValue AtlasConfigToJson(const AtlasConfig& cfg)
{
  JsonValue root = JsonValue::MakeObject();

  JsonValue grid = JsonValue::MakeObject();
  JsonValue res = JsonValue::MakeArray();
  for (int r : cfg.grid.resolutions) res.arrayValue.push_back(JsonValue::MakeNumber(r));
  AddJsonMember(grid, "resolutions", std::move(res));
  AddJsonMember(grid, "bounds_margin", JsonValue::MakeNumber(cfg.grid.boundsMargin));
  AddJsonMember(root, "grid", std::move(grid));

  JsonValue sel = JsonValue::MakeObject();
  AddJsonMember(sel, "policy", JsonValue::MakeString(SelectionPolicyName(cfg.selection.policy)));
  AddJsonMember(sel, "tie_break", JsonValue::MakeString(TieBreakName(cfg.selection.tieBreak)));
  AddJsonMember(sel, "dense_cell_threshold", JsonValue::MakeNumber(cfg.selection.denseCellThreshold));
  AddJsonMember(sel, "sub_grid_size", JsonValue::MakeNumber(cfg.selection.subGridSize));
  AddJsonMember(sel, "examples_per_cell", JsonValue::MakeNumber(cfg.selection.examplesPerCell));
  AddJsonMember(root, "selection", std::move(sel));

  JsonValue den = JsonValue::MakeObject();
  AddJsonMember(den, "method", JsonValue::MakeString(DensityMethodName(cfg.density.method)));
  AddJsonMember(den, "percentile", JsonValue::MakeNumber(cfg.density.percentile));
  AddJsonMember(den, "reference_resolution", JsonValue::MakeNumber(cfg.density.referenceResolution));
  AddJsonMember(root, "density", std::move(den));

  JsonValue lay = JsonValue::MakeObject();
  AddJsonMember(lay, "base_size", JsonValue::MakeNumber(cfg.layout.baseSize));
  AddJsonMember(lay, "min_size", JsonValue::MakeNumber(cfg.layout.minSize));
  AddJsonMember(lay, "spacing", JsonValue::MakeNumber(cfg.layout.spacing));
  AddJsonMember(lay, "cell_pitch", JsonValue::MakeNumber(cfg.layout.cellPitch));
  AddJsonMember(lay, "caption_offset", JsonValue::MakeNumber(cfg.layout.captionOffset));
  AddJsonMember(lay, "caption_max_chars", JsonValue::MakeNumber(cfg.layout.captionMaxChars));
  AddJsonMember(root, "layout", std::move(lay));

  JsonValue ex = JsonValue::MakeObject();
  AddJsonMember(ex, "include_examples", JsonValue::MakeBool(cfg.exportCfg.includeExamples));
  AddJsonMember(ex, "include_placement", JsonValue::MakeBool(cfg.exportCfg.includePlacement));
  AddJsonMember(ex, "image_template", JsonValue::MakeString(cfg.exportCfg.imageTemplate));
  AddJsonMember(ex, "max_file_bytes", JsonValue::MakeNumber(static_cast<double>(cfg.exportCfg.maxFileBytes)));
  AddJsonMember(ex, "write_retries", JsonValue::MakeNumber(cfg.exportCfg.writeRetries));
  AddJsonMember(root, "export", std::move(ex));

  AddJsonMember(root, "threads", JsonValue::MakeNumber(cfg.threads));
  return root;
}

bool ApplyAtlasConfigJson(const JsonValue& root, AtlasConfig& ioCfg, AtlasError& err)
{
  err.clear();
  if (!root.isObject()) return FailConfig(err, "config root must be a JSON object");

  // Work on a copy so a failed apply leaves the caller's config untouched.
  AtlasConfig cfg = ioCfg;
  std::string msg;
  bool ok = true;

  if (!CheckKeys(root, "config", {"grid", "selection", "density", "layout", "export", "threads"}, msg)) {
    return FailConfig(err, msg);
  }

  if (const JsonValue* s = Section(root, "grid", msg, ok)) ok = ApplyGrid(*s, cfg.grid, msg);
  if (ok) {
    if (const JsonValue* s = Section(root, "selection", msg, ok)) ok = ApplySelection(*s, cfg.selection, msg);
  }
  if (ok) {
    if (const JsonValue* s = Section(root, "density", msg, ok)) ok = ApplyDensity(*s, cfg.density, msg);
  }
  if (ok) {
    if (const JsonValue* s = Section(root, "layout", msg, ok)) ok = ApplyLayout(*s, cfg.layout, msg);
  }
  if (ok) {
    if (const JsonValue* s = Section(root, "export", msg, ok)) ok = ApplyExport(*s, cfg.exportCfg, msg);
  }
  if (ok) ok = ApplyI32(root, "threads", cfg.threads, msg);

  if (!ok) return FailConfig(err, msg);

  ioCfg = std::move(cfg);
  return true;
}

bool LoadAtlasConfigJsonFile(const std::string& path, AtlasConfig& ioCfg, AtlasError& err)
{
  err.clear();

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    err.path = path;
    return FailConfig(err, "unable to open config file");
  }

  std::ostringstream oss;
  oss << f.rdbuf();

  JsonValue root;
  std::string perr;
  if (!ParseJson(oss.str(), root, perr)) {
    err.path = path;
    return FailConfig(err, perr);
  }

  if (!ApplyAtlasConfigJson(root, ioCfg, err)) {
    err.path = path;
    return false;
  }
  return true;
}

} // namespace gridatlas
