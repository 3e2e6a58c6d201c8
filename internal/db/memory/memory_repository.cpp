#include "memory_repository.hpp"

#include "internal/db/api/subjects.hpp"
#include "memory_tx.hpp"

namespace typelog::db::memory {

namespace {

// First row strictly beneath `prefix` and strictly after `after_subject`.
template <typename RowsT>
auto FirstChild(RowsT& rows, const std::string& prefix, const std::optional<std::string>& after_subject) {
  auto lower = ChildLowerBound(prefix);
  if (after_subject.has_value() && *after_subject > lower) {
    lower = *after_subject;
  }
  return rows.upper_bound(lower);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

void MemoryRepository::Apply(const std::vector<Mutation>& mutations) {
  std::scoped_lock lock(mutex_);
  for (const auto& m : mutations) {
    switch (m.kind) {
      case Mutation::Kind::Set:
        committed_[m.record.subject][m.record.attribute] = m.record;
        break;
      case Mutation::Kind::DeleteSubject:
        committed_.erase(m.record.subject);
        break;
      case Mutation::Kind::DeletePrefix: {
        auto first = committed_.upper_bound(ChildLowerBound(m.record.subject));
        auto last  = committed_.lower_bound(ChildUpperBound(m.record.subject));
        committed_.erase(first, last);
        break;
      }
    }
  }
}

Result MemoryRepository::SetAttribute(Transaction& t, const model::AttributeRecord& r) {
  if (r.subject.empty() || r.attribute.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "subject and attribute must be non-empty");
  }
  TX(t).Stage(Mutation{Mutation::Kind::Set, r});
  return Result::Ok();
}

std::vector<model::AttributeRecord> MemoryRepository::ResolveRow(Transaction&, const std::string& subject) {
  std::vector<model::AttributeRecord> out;
  std::scoped_lock                    lock(mutex_);
  const auto                          it = committed_.find(subject);
  if (it == committed_.end()) {
    return out;
  }
  out.reserve(it->second.size());
  for (const auto& [_, record] : it->second) {
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeleteSubject(Transaction& t, const std::string& subject) {
  model::AttributeRecord target;
  target.subject = subject;
  TX(t).Stage(Mutation{Mutation::Kind::DeleteSubject, std::move(target)});
  return Result::Ok();
}

std::vector<model::AttributeRecord> MemoryRepository::ScanAttribute(Transaction&, const std::string& subject_prefix, const std::string& attribute,
                                                                    const std::optional<std::string>& after_subject,
                                                                    std::optional<uint64_t> max_records) {
  std::vector<model::AttributeRecord> out;
  if (max_records.has_value() && *max_records == 0) {
    return out;
  }

  std::scoped_lock lock(mutex_);
  const auto       upper = ChildUpperBound(subject_prefix);
  for (auto it = FirstChild(committed_, subject_prefix, after_subject); it != committed_.end() && it->first < upper; ++it) {
    const auto cell = it->second.find(attribute);
    if (cell == it->second.end()) {
      continue;
    }
    out.push_back(cell->second);
    if (max_records.has_value() && out.size() >= *max_records) {
      break;
    }
  }
  return out;
}

uint64_t MemoryRepository::CountAttribute(Transaction&, const std::string& subject_prefix, const std::string& attribute) {
  std::scoped_lock lock(mutex_);
  const auto       upper = ChildUpperBound(subject_prefix);
  uint64_t         count = 0;
  for (auto it = FirstChild(committed_, subject_prefix, std::nullopt); it != committed_.end() && it->first < upper; ++it) {
    if (it->second.contains(attribute)) {
      ++count;
    }
  }
  return count;
}

Result MemoryRepository::DeleteSubjectsWithPrefix(Transaction& t, const std::string& subject_prefix) {
  model::AttributeRecord target;
  target.subject = subject_prefix;
  TX(t).Stage(Mutation{Mutation::Kind::DeletePrefix, std::move(target)});
  return Result::Ok();
}

} // namespace typelog::db::memory
