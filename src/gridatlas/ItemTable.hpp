#pragma once

#include "gridatlas/Error.hpp"
#include "gridatlas/Types.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace gridatlas {

// Projected item tables.
//
// Two formats are accepted:
//  - CSV with a header row (RFC 4180 quoting; quoted fields may span lines)
//  - JSON Lines, one object per line (blank lines are skipped)
//
// Rows whose id, x or y is missing or empty are skipped and reported as
// RejectedRow warnings. Coordinates that are present but non-numeric or
// non-finite, and duplicate identifiers, fail the whole table with an
// InputValidation error listing the offending rows.

enum class ItemTableFormat : unsigned char {
  Auto = 0,
  Csv,
  JsonLines,
};

struct ItemColumns {
  std::string id = "id";
  std::string x = "x";
  std::string y = "y";
  std::string caption = "caption";
  std::string url = "url";
  std::string image = "image";
};

struct ItemTableOptions {
  ItemTableFormat format = ItemTableFormat::Auto;
  ItemColumns columns{};

  // Offending rows listed in an error; the total is always reported.
  int maxReportedRows = 20;
};

struct ItemTable {
  std::vector<Item> items;
  std::vector<AtlasWarning> warnings;

  // Data rows seen (excluding the CSV header and blank JSONL lines).
  int rowsRead = 0;
  int rowsRejected = 0;
};

// Pick the format from the file extension (.csv, .jsonl, .ndjson).
bool DetectItemTableFormat(const std::string& path, ItemTableFormat& out);

bool ParseItemCsv(std::istream& is, const ItemTableOptions& opt, ItemTable& out, AtlasError& err);
bool ParseItemJsonLines(std::istream& is, const ItemTableOptions& opt, ItemTable& out, AtlasError& err);

bool LoadItemTable(const std::string& path, const ItemTableOptions& opt, ItemTable& out, AtlasError& err);

// Checks for programmatic input: finite coordinates, non-empty and unique ids.
// Rows are reported as 0-based item indices.
bool ValidateItems(const std::vector<Item>& items, AtlasError& err, int maxReportedRows = 20);

// Split one CSV document into records. Returns false on an unterminated quote.
bool SplitCsvRecords(const std::string& text, std::vector<std::vector<std::string>>& outRecords,
                     std::string& outError);

} // namespace gridatlas
