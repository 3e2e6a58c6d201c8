#pragma once

#include <string>

#include <google/protobuf/message.h>

#include "typelog/v1.hpp"

namespace typelog::collection {

// Returns `message` itself when it already is an Envelope, otherwise a new
// Envelope whose payload packs it.
typelog::v1::Envelope WrapIfNeeded(const google::protobuf::Message& message);

// Full protobuf name of the packed payload (the part of the Any type URL
// after its last '/'), or the Envelope's own name when nothing is packed.
std::string RoutingTypeName(const typelog::v1::Envelope& envelope);

} // namespace typelog::collection
