#include <google/protobuf/util/json_util.h>
#include <google/protobuf/wrappers.pb.h>

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/collection/multi_type_collection.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/deletion_pool.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/random.hpp"

using namespace typelog;

static void Usage() {
  std::cout << "Usage:\n"
            << "  typelogctl <config.yaml> add <urn> <string|int|bool|bytes> <value> [--timestamp us] [--suffix n]\n"
            << "  typelogctl <config.yaml> types <urn>\n"
            << "  typelogctl <config.yaml> scan <urn> <type> [--after ts[.suffix]] [--limit n] [--no-suffix]\n"
            << "  typelogctl <config.yaml> dump <urn>\n"
            << "  typelogctl <config.yaml> count <urn> [type]\n"
            << "  typelogctl <config.yaml> delete <urn>\n";
}

namespace {

// Usage errors exit with 1; everything thrown from the collection exits with 2.
class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

struct Flags {
  std::vector<std::string>               positional;
  std::optional<uint64_t>                timestamp_us;
  std::optional<uint32_t>                suffix;
  std::optional<collection::OrderingKey> after;
  std::optional<uint64_t>                limit;
  bool                                   include_suffix = true;
};

template <typename T>
std::optional<T> ParseNumber(const std::string& value) {
  T          parsed{};
  const auto end = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
  if (value.empty() || ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return parsed;
}

uint64_t ParseUnsigned(const std::string& flag, const std::string& value) {
  auto parsed = ParseNumber<uint64_t>(value);
  if (!parsed) {
    throw UsageError(flag + ": expected an unsigned integer, got '" + value + "'");
  }
  return *parsed;
}

Flags ParseFlags(int argc, char** argv, int first) {
  Flags flags;
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    auto              value = [&]() -> std::string {
      if (i + 1 >= argc) throw UsageError(arg + " requires a value");
      return argv[++i];
    };

    if (arg == "--timestamp") {
      flags.timestamp_us = ParseUnsigned(arg, value());
    } else if (arg == "--suffix") {
      const auto suffix = ParseUnsigned(arg, value());
      if (suffix > collection::kMaxSuffix) throw UsageError("--suffix must not exceed 16777215");
      flags.suffix = static_cast<uint32_t>(suffix);
    } else if (arg == "--after") {
      const auto text = value();
      flags.after     = collection::ParseOrderingKey(text);
      if (!flags.after) throw UsageError("--after: expected ts[.suffix], got '" + text + "'");
    } else if (arg == "--limit") {
      flags.limit = ParseUnsigned(arg, value());
    } else if (arg == "--no-suffix") {
      flags.include_suffix = false;
    } else {
      flags.positional.push_back(arg);
    }
  }
  return flags;
}

const std::string& Positional(const Flags& flags, size_t index, const char* name) {
  if (index >= flags.positional.size()) {
    throw UsageError(std::string("missing argument <") + name + ">");
  }
  return flags.positional[index];
}

std::unique_ptr<google::protobuf::Message> MakePayload(const std::string& kind, const std::string& value) {
  if (kind == "string") {
    auto msg = std::make_unique<google::protobuf::StringValue>();
    msg->set_value(value);
    return msg;
  }
  if (kind == "int") {
    auto msg = std::make_unique<google::protobuf::Int64Value>();
    auto parsed = ParseNumber<int64_t>(value);
    if (!parsed) throw UsageError("int payload: not a number: '" + value + "'");
    msg->set_value(*parsed);
    return msg;
  }
  if (kind == "bool") {
    if (value != "true" && value != "false") throw UsageError("bool payload must be true or false");
    auto msg = std::make_unique<google::protobuf::BoolValue>();
    msg->set_value(value == "true");
    return msg;
  }
  if (kind == "bytes") {
    auto msg = std::make_unique<google::protobuf::BytesValue>();
    msg->set_value(value);
    return msg;
  }
  throw UsageError("unsupported payload kind: " + kind);
}

std::string ToJson(const google::protobuf::Message& message) {
  std::string                            json;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to render JSON: " + std::string(status.message()));
  }
  return json;
}

collection::AccessToken TokenFromEnvironment(const std::string& reason) {
  collection::AccessToken token;
  const char*             user = std::getenv("USER");
  token.username               = user != nullptr ? user : "typelogctl";
  token.reason                 = reason;
  return token;
}

int Run(const factory::RuntimeDependencies& deps, const std::string& cmd, const Flags& flags) {
  const auto& urn = Positional(flags, 0, "urn");
  collection::MultiTypeCollection coll(deps.collections, urn, TokenFromEnvironment("typelogctl " + cmd));

  // ------------------------------------------------------------

  if (cmd == "add") {
    auto payload = MakePayload(Positional(flags, 1, "kind"), Positional(flags, 2, "value"));

    typelog::v1::Envelope envelope;
    envelope.mutable_payload()->PackFrom(*payload);
    envelope.set_source("typelogctl");
    envelope.set_session_id(util::GenerateUuidString());

    collection::AddOptions options;
    options.timestamp_us = flags.timestamp_us;
    options.suffix       = flags.suffix;

    std::cout << collection::ToString(coll.Add(&envelope, options)) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "types") {
    for (const auto& type_name : coll.ListStoredTypes()) {
      std::cout << type_name << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "scan") {
    auto cursor = coll.ScanByType(Positional(flags, 1, "type"), flags.after, flags.include_suffix, flags.limit);
    while (auto entry = cursor.Next()) {
      std::cout << collection::ToString(entry->key) << " " << ToJson(entry->value) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "dump") {
    auto cursor = coll.Iterate();
    while (auto entry = cursor.Next()) {
      std::cout << entry->type_name << " " << collection::ToString(entry->key) << " " << ToJson(entry->value) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "count") {
    if (flags.positional.size() > 1) {
      std::cout << coll.LengthByType(flags.positional[1]) << "\n";
    } else {
      std::cout << coll.Size() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    db::DeletionPool pool(deps.repository);
    pool.MarkForDeletion(urn);
    coll.OnDelete(pool);
    const auto marked = pool.Marked();
    pool.Flush();

    for (const auto& deleted : marked) {
      std::cout << "deleted " << deleted << "\n";
    }
    return 0;
  }

  throw UsageError("unknown command: " + cmd);
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = config::ConfigLoader::LoadFromYaml(config_path);
    observability::InitializeLogging(config);

    auto deps = factory::BuildRuntime(config);
    int  rc   = Run(deps, cmd, ParseFlags(argc, argv, 3));

    observability::ShutdownLogging();
    return rc;
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    return 1;
  } catch (const std::exception& e) {
    TYPELOG_LOG_ERROR("command failed", {observability::StringField("command", cmd), observability::StringField("error", e.what())});
    observability::ShutdownLogging();
    return 2;
  }
}
