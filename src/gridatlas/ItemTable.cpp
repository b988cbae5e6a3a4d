#include "gridatlas/ItemTable.hpp"

#include "gridatlas/Json.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <istream>
#include <iterator>
#include <sstream>
#include <unordered_map>

namespace gridatlas {

namespace {

std::string Trim(const std::string& s)
{
  std::size_t a = 0;
  std::size_t b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
  return s.substr(a, b - a);
}

std::string ToLower(std::string s)
{
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// Strict coordinate parse: the whole (trimmed) text must be a finite number.
bool ParseCoordinate(const std::string& text, double& out)
{
  const std::string t = Trim(text);
  if (t.empty()) return false;

  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(t.c_str(), &end);
  if (errno != 0) return false;
  if (!end || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  out = v;
  return true;
}

struct RawField {
  bool present = false;
  std::string text;
  bool isNumber = false;
  double number = 0.0;
};

struct RawRow {
  int row = 0;
  RawField id;
  RawField x;
  RawField y;
  ItemMeta meta;
};

// Turns raw rows into items, collecting rejected rows and fatal issues.
class RowCollector {
public:
  RowCollector(ItemTable& out, int maxReported) : m_out(out), m_maxReported(std::max(0, maxReported)) {}

  void add(RawRow&& r)
  {
    ++m_out.rowsRead;

    const char* missing = nullptr;
    if (!r.id.present || Trim(r.id.text).empty()) missing = "id";
    else if (!r.x.present || Trim(r.x.text).empty()) missing = "x";
    else if (!r.y.present || Trim(r.y.text).empty()) missing = "y";

    if (missing) {
      AtlasWarning w;
      w.kind = WarningKind::RejectedRow;
      w.row = r.row;
      w.itemId = r.id.text;
      w.message = std::string("missing ") + missing;
      m_out.warnings.push_back(std::move(w));
      ++m_out.rowsRejected;
      return;
    }

    Item it;
    it.id = r.id.text;

    bool ok = coordinate(r, r.x, "x", it.x);
    ok = coordinate(r, r.y, "y", it.y) && ok;

    auto [pos, inserted] = m_firstRow.emplace(it.id, r.row);
    if (!inserted) {
      issue(r.row, it.id, "duplicate id (first seen at row " + std::to_string(pos->second) + ")");
      ok = false;
    }

    if (!ok) return;
    it.meta = std::move(r.meta);
    m_out.items.push_back(std::move(it));
  }

  void issue(int row, std::string id, std::string reason)
  {
    ++m_total;
    if (static_cast<int>(m_issues.size()) >= m_maxReported) return;
    RowIssue ri;
    ri.row = row;
    ri.itemId = std::move(id);
    ri.reason = std::move(reason);
    m_issues.push_back(std::move(ri));
  }

  bool finish(AtlasError& err)
  {
    if (m_total == 0) return true;
    FailInput(err, std::to_string(m_total) + " invalid row" + (m_total == 1 ? "" : "s") + " in item table");
    err.rows = std::move(m_issues);
    err.totalRowIssues = m_total;
    m_out.items.clear();
    return false;
  }

private:
  bool coordinate(const RawRow& r, const RawField& f, const char* axis, double& out)
  {
    if (f.isNumber) {
      if (std::isfinite(f.number)) {
        out = f.number;
        return true;
      }
    } else if (ParseCoordinate(f.text, out)) {
      return true;
    }
    issue(r.row, r.id.text, std::string(axis) + " is not a finite number: '" + f.text + "'");
    return false;
  }

  ItemTable& m_out;
  int m_maxReported = 20;
  std::vector<RowIssue> m_issues;
  int m_total = 0;
  std::unordered_map<std::string, int> m_firstRow;
};

int FindColumn(const std::vector<std::string>& header, const std::string& name)
{
  for (std::size_t i = 0; i < header.size(); ++i) {
    if (header[i] == name) return static_cast<int>(i);
  }
  return -1;
}

RawField JsonField(const JsonValue* v)
{
  RawField f;
  if (!v || v->isNull()) return f;
  f.present = true;
  if (v->isString()) {
    f.text = v->stringValue;
  } else if (v->isNumber()) {
    f.isNumber = true;
    f.number = v->numberValue;
    f.text = JsonNumberText(v->numberValue);
  } else if (v->isBool()) {
    f.text = v->boolValue ? "true" : "false";
  } else {
    JsonWriteOptions opt;
    opt.pretty = false;
    f.text = JsonStringify(*v, opt);
  }
  return f;
}

} // namespace

bool DetectItemTableFormat(const std::string& path, ItemTableFormat& out)
{
  const std::string ext = ToLower(std::filesystem::path(path).extension().string());
  if (ext == ".csv") {
    out = ItemTableFormat::Csv;
    return true;
  }
  if (ext == ".jsonl" || ext == ".ndjson") {
    out = ItemTableFormat::JsonLines;
    return true;
  }
  return false;
}

bool SplitCsvRecords(const std::string& text, std::vector<std::vector<std::string>>& outRecords,
                     std::string& outError)
{
  outRecords.clear();
  outError.clear();

  std::vector<std::string> record;
  std::string field;
  bool inQuotes = false;
  bool fieldStarted = false;
  int line = 1;
  int quoteLine = 0;

  auto endField = [&]() {
    record.push_back(std::move(field));
    field.clear();
    fieldStarted = false;
  };
  auto endRecord = [&]() {
    endField();
    // A blank line yields one empty field; skip it.
    if (!(record.size() == 1 && record.front().empty())) outRecords.push_back(std::move(record));
    record.clear();
  };

  std::size_t i = 0;
  // UTF-8 byte order mark.
  if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
      static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF) {
    i = 3;
  }

  for (; i < text.size(); ++i) {
    const char c = text[i];
    if (inQuotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          inQuotes = false;
        }
      } else {
        if (c == '\n') ++line;
        field.push_back(c);
      }
      continue;
    }

    if (c == '"' && !fieldStarted) {
      inQuotes = true;
      fieldStarted = true;
      quoteLine = line;
    } else if (c == ',') {
      endField();
    } else if (c == '\r') {
      if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
      endRecord();
      ++line;
    } else if (c == '\n') {
      endRecord();
      ++line;
    } else {
      field.push_back(c);
      fieldStarted = true;
    }
  }

  if (inQuotes) {
    outError = "unterminated quoted field starting at line " + std::to_string(quoteLine);
    return false;
  }
  if (fieldStarted || !field.empty() || !record.empty()) endRecord();
  return true;
}

bool ParseItemCsv(std::istream& is, const ItemTableOptions& opt, ItemTable& out, AtlasError& err)
{
  out = ItemTable{};

  const std::string text((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
  if (is.bad()) return FailInput(err, "read error in CSV item table");

  std::vector<std::vector<std::string>> records;
  std::string splitErr;
  if (!SplitCsvRecords(text, records, splitErr)) return FailInput(err, "malformed CSV: " + splitErr);
  if (records.empty()) return true;

  const std::vector<std::string>& header = records.front();
  const ItemColumns& cols = opt.columns;
  const int cId = FindColumn(header, cols.id);
  const int cX = FindColumn(header, cols.x);
  const int cY = FindColumn(header, cols.y);
  const int cCaption = FindColumn(header, cols.caption);
  const int cUrl = FindColumn(header, cols.url);
  const int cImage = FindColumn(header, cols.image);

  if (cId < 0) return FailInput(err, "CSV header has no '" + cols.id + "' column");
  if (cX < 0) return FailInput(err, "CSV header has no '" + cols.x + "' column");
  if (cY < 0) return FailInput(err, "CSV header has no '" + cols.y + "' column");

  RowCollector collector(out, opt.maxReportedRows);
  for (std::size_t r = 1; r < records.size(); ++r) {
    const std::vector<std::string>& rec = records[r];
    auto field = [&](int c) {
      RawField f;
      if (c >= 0 && static_cast<std::size_t>(c) < rec.size()) {
        f.present = true;
        f.text = rec[static_cast<std::size_t>(c)];
      }
      return f;
    };
    auto cellText = [&](int c) {
      return (c >= 0 && static_cast<std::size_t>(c) < rec.size()) ? rec[static_cast<std::size_t>(c)] : std::string();
    };

    RawRow row;
    row.row = static_cast<int>(r);
    row.id = field(cId);
    row.x = field(cX);
    row.y = field(cY);
    row.meta.caption = cellText(cCaption);
    row.meta.url = cellText(cUrl);
    row.meta.image = cellText(cImage);

    for (std::size_t c = 0; c < header.size(); ++c) {
      const int ci = static_cast<int>(c);
      if (ci == cId || ci == cX || ci == cY || ci == cCaption || ci == cUrl || ci == cImage) continue;
      row.meta.extra.emplace_back(header[c], cellText(ci));
    }
    collector.add(std::move(row));
  }
  return collector.finish(err);
}

bool ParseItemJsonLines(std::istream& is, const ItemTableOptions& opt, ItemTable& out, AtlasError& err)
{
  out = ItemTable{};
  const ItemColumns& cols = opt.columns;
  RowCollector collector(out, opt.maxReportedRows);

  std::string line;
  int lineNo = 0;
  while (std::getline(is, line)) {
    ++lineNo;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (Trim(line).empty()) continue;

    JsonValue obj;
    std::string parseErr;
    if (!ParseJson(line, obj, parseErr)) {
      ++out.rowsRead;
      collector.issue(lineNo, std::string(), "invalid JSON: " + parseErr);
      continue;
    }
    if (!obj.isObject()) {
      ++out.rowsRead;
      collector.issue(lineNo, std::string(), "line is not a JSON object");
      continue;
    }

    RawRow row;
    row.row = lineNo;
    row.id = JsonField(FindJsonMember(obj, cols.id));
    row.x = JsonField(FindJsonMember(obj, cols.x));
    row.y = JsonField(FindJsonMember(obj, cols.y));
    row.meta.caption = JsonField(FindJsonMember(obj, cols.caption)).text;
    row.meta.url = JsonField(FindJsonMember(obj, cols.url)).text;
    row.meta.image = JsonField(FindJsonMember(obj, cols.image)).text;

    for (const auto& kv : obj.objectValue) {
      const std::string& k = kv.first;
      if (k == cols.id || k == cols.x || k == cols.y || k == cols.caption || k == cols.url || k == cols.image) continue;
      row.meta.extra.emplace_back(k, JsonField(&kv.second).text);
    }
    collector.add(std::move(row));
  }
  if (is.bad()) return FailInput(err, "read error in JSON Lines item table");

  return collector.finish(err);
}

bool LoadItemTable(const std::string& path, const ItemTableOptions& opt, ItemTable& out, AtlasError& err)
{
  ItemTableFormat format = opt.format;
  if (format == ItemTableFormat::Auto && !DetectItemTableFormat(path, format)) {
    FailConfig(err, "unknown item table format (expected .csv, .jsonl or .ndjson)");
    err.path = path;
    return false;
  }

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    FailInput(err, "unable to open item table");
    err.path = path;
    return false;
  }

  const bool ok = (format == ItemTableFormat::Csv) ? ParseItemCsv(f, opt, out, err)
                                                   : ParseItemJsonLines(f, opt, out, err);
  if (!ok) err.path = path;
  return ok;
}

bool ValidateItems(const std::vector<Item>& items, AtlasError& err, int maxReportedRows)
{
  std::vector<RowIssue> issues;
  int total = 0;
  auto issue = [&](int row, const std::string& id, std::string reason) {
    ++total;
    if (static_cast<int>(issues.size()) >= maxReportedRows) return;
    RowIssue ri;
    ri.row = row;
    ri.itemId = id;
    ri.reason = std::move(reason);
    issues.push_back(std::move(ri));
  };

  std::unordered_map<std::string, int> firstIndex;
  firstIndex.reserve(items.size());
  for (std::size_t i = 0; i < items.size(); ++i) {
    const Item& it = items[i];
    const int row = static_cast<int>(i);
    if (it.id.empty()) issue(row, it.id, "empty id");
    if (!std::isfinite(it.x)) issue(row, it.id, "x is not finite");
    if (!std::isfinite(it.y)) issue(row, it.id, "y is not finite");

    auto [pos, inserted] = firstIndex.emplace(it.id, row);
    if (!inserted && !it.id.empty()) {
      issue(row, it.id, "duplicate id (first seen at item " + std::to_string(pos->second) + ")");
    }
  }

  if (total == 0) return true;
  FailInput(err, std::to_string(total) + " invalid item" + (total == 1 ? "" : "s"));
  err.rows = std::move(issues);
  err.totalRowIssues = total;
  return false;
}

} // namespace gridatlas
