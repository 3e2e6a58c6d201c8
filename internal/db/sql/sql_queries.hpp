#pragma once

namespace typelog::db::sql {

/*
  Canonical SQL for the attribute table.

  IMPORTANT:
  Written in the SQLite dialect ('?' placeholders). Ranged statements take
  the exclusive bounds produced by ChildLowerBound/ChildUpperBound.
*/

static constexpr const char* UPSERT_ATTRIBUTE =
    "INSERT INTO attributes(subject,attribute,value,timestamp_us)"
    " VALUES(?,?,?,?)"
    " ON CONFLICT(subject,attribute) DO UPDATE SET"
    " value=excluded.value,"
    " timestamp_us=excluded.timestamp_us;";

static constexpr const char* SELECT_ROW =
    "SELECT subject,attribute,value,timestamp_us"
    " FROM attributes WHERE subject=? ORDER BY attribute ASC;";

static constexpr const char* DELETE_ROW =
    "DELETE FROM attributes WHERE subject=?;";

// ranged

static constexpr const char* SCAN_ATTRIBUTE =
    "SELECT subject,attribute,value,timestamp_us"
    " FROM attributes WHERE attribute=? AND subject>? AND subject<?"
    " ORDER BY subject ASC LIMIT ?;";

static constexpr const char* COUNT_ATTRIBUTE =
    "SELECT COUNT(*) FROM attributes"
    " WHERE attribute=? AND subject>? AND subject<?;";

static constexpr const char* DELETE_ROWS_IN_RANGE =
    "DELETE FROM attributes WHERE subject>? AND subject<?;";

} // namespace typelog::db::sql
