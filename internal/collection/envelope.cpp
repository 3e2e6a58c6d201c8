#include "internal/collection/envelope.hpp"

#include "internal/util/errors.hpp"

namespace typelog::collection {

typelog::v1::Envelope WrapIfNeeded(const google::protobuf::Message& message) {
  if (const auto* envelope = dynamic_cast<const typelog::v1::Envelope*>(&message)) {
    return *envelope;
  }

  // Dynamic messages of the Envelope type are not the generated class.
  if (message.GetDescriptor()->full_name() == typelog::v1::Envelope::descriptor()->full_name()) {
    typelog::v1::Envelope envelope;
    if (!envelope.ParseFromString(message.SerializeAsString())) {
      throw util::InvalidArgument("envelope payload could not be re-read as " + envelope.GetTypeName());
    }
    return envelope;
  }

  typelog::v1::Envelope envelope;
  envelope.mutable_payload()->PackFrom(message);
  return envelope;
}

std::string RoutingTypeName(const typelog::v1::Envelope& envelope) {
  if (envelope.has_payload() && !envelope.payload().type_url().empty()) {
    const auto& url   = envelope.payload().type_url();
    const auto  slash = url.rfind('/');
    auto        name  = slash == std::string::npos ? url : url.substr(slash + 1);
    if (!name.empty()) {
      return name;
    }
  }
  return typelog::v1::Envelope::descriptor()->full_name();
}

} // namespace typelog::collection
