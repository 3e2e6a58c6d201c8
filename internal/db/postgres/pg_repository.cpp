#include "pg_repository.hpp"

#include <cstdint>
#include <limits>
#include <string>

#include "internal/db/api/subjects.hpp"
#include "internal/util/errors.hpp"

namespace typelog::db::postgres {

namespace {

std::string HexEncode(const std::string& bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    out.push_back(kDigits[c >> 4]);
    out.push_back(kDigits[c & 0x0f]);
  }
  return out;
}

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  throw util::StoreError("postgres: invalid hex digit in attribute value");
}

std::string HexDecode(const std::string& hex) {
  if (hex.size() % 2 != 0) throw util::StoreError("postgres: odd-length hex attribute value");
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    out.push_back(static_cast<char>((HexNibble(hex[i]) << 4) | HexNibble(hex[i + 1])));
  }
  return out;
}

model::AttributeRecord FromRow(const pqxx::row& row) {
  model::AttributeRecord r;
  r.subject      = row[0].c_str();
  r.attribute    = row[1].c_str();
  r.value        = HexDecode(row[2].c_str());
  r.timestamp_us = static_cast<uint64_t>(row[3].as<int64_t>());
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::SetAttribute(Transaction& t, const model::AttributeRecord& r) {
  if (r.subject.empty() || r.attribute.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "subject and attribute must be non-empty");
  }
  try {
    TX(t).Work().exec_prepared("upsert_attribute", r.subject, r.attribute, HexEncode(r.value),
                               static_cast<int64_t>(r.timestamp_us));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AttributeRecord> PgRepository::ResolveRow(Transaction& t, const std::string& subject) {
  pqxx::result res;
  try {
    res = TX(t).Work().exec_prepared("select_row", subject);
  } catch (const std::exception& e) {
    throw util::StoreError(std::string("postgres resolve: ") + e.what());
  }

  std::vector<model::AttributeRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(FromRow(row));
  }
  return out;
}

Result PgRepository::DeleteSubject(Transaction& t, const std::string& subject) {
  try {
    TX(t).Work().exec_prepared("delete_row", subject);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AttributeRecord> PgRepository::ScanAttribute(Transaction& t, const std::string& subject_prefix,
                                                                const std::string& attribute,
                                                                const std::optional<std::string>& after_subject,
                                                                std::optional<uint64_t> max_records) {
  std::vector<model::AttributeRecord> out;
  if (max_records.has_value() && *max_records == 0) return out;

  auto lower = ChildLowerBound(subject_prefix);
  if (after_subject.has_value() && *after_subject > lower) lower = *after_subject;

  const auto cap = std::numeric_limits<int64_t>::max();
  const int64_t limit =
      max_records.has_value() && *max_records < static_cast<uint64_t>(cap) ? static_cast<int64_t>(*max_records) : cap;

  pqxx::result res;
  try {
    res = TX(t).Work().exec_prepared("scan_attribute", attribute, lower, ChildUpperBound(subject_prefix), limit);
  } catch (const std::exception& e) {
    throw util::StoreError(std::string("postgres scan: ") + e.what());
  }
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(FromRow(row));
  }
  return out;
}

uint64_t PgRepository::CountAttribute(Transaction& t, const std::string& subject_prefix, const std::string& attribute) {
  try {
    auto res = TX(t).Work().exec_prepared("count_attribute", attribute, ChildLowerBound(subject_prefix),
                                          ChildUpperBound(subject_prefix));
    return static_cast<uint64_t>(res[0][0].as<int64_t>());
  } catch (const std::exception& e) {
    throw util::StoreError(std::string("postgres count: ") + e.what());
  }
}

Result PgRepository::DeleteSubjectsWithPrefix(Transaction& t, const std::string& subject_prefix) {
  try {
    TX(t).Work().exec_prepared("delete_rows_in_range", ChildLowerBound(subject_prefix), ChildUpperBound(subject_prefix));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

}
