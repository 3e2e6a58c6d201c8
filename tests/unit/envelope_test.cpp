#include "internal/collection/envelope.hpp"

#include <google/protobuf/wrappers.pb.h>

#include <cassert>
#include <iostream>
#include <string>

namespace {

using typelog::collection::RoutingTypeName;
using typelog::collection::WrapIfNeeded;

void TestPlainMessageIsWrapped() {
  google::protobuf::StringValue value;
  value.set_value("hello");

  auto envelope = WrapIfNeeded(value);
  assert(envelope.has_payload());
  assert(envelope.payload().Is<google::protobuf::StringValue>());

  google::protobuf::StringValue unpacked;
  assert(envelope.payload().UnpackTo(&unpacked));
  assert(unpacked.value() == "hello");
  assert(RoutingTypeName(envelope) == "google.protobuf.StringValue");
}

void TestEnvelopeIsNotWrappedTwice() {
  google::protobuf::Int64Value value;
  value.set_value(42);

  typelog::v1::Envelope original;
  original.mutable_payload()->PackFrom(value);
  original.set_source("sensor-7");

  auto envelope = WrapIfNeeded(original);
  assert(envelope.source() == "sensor-7");
  assert(envelope.payload().Is<google::protobuf::Int64Value>());
  assert(RoutingTypeName(envelope) == "google.protobuf.Int64Value");

  // idempotent
  auto again = WrapIfNeeded(envelope);
  assert(again.SerializeAsString() == envelope.SerializeAsString());
}

void TestEmptyEnvelopeRoutesToItsOwnType() {
  typelog::v1::Envelope empty;
  empty.set_source("no payload");

  assert(RoutingTypeName(WrapIfNeeded(empty)) == "typelog.v1.Envelope");
}

void TestTypeUrlWithoutSlash() {
  typelog::v1::Envelope envelope;
  envelope.mutable_payload()->set_type_url("custom.Type");
  assert(RoutingTypeName(envelope) == "custom.Type");

  envelope.mutable_payload()->set_type_url("example.com/");
  assert(RoutingTypeName(envelope) == "typelog.v1.Envelope");
}

} // namespace

int main() {
  TestPlainMessageIsWrapped();
  TestEnvelopeIsNotWrappedTwice();
  TestEmptyEnvelopeRoutesToItsOwnType();
  TestTypeUrlWithoutSlash();

  std::cout << "typelog_unit_envelope: pass\n";
  return 0;
}
