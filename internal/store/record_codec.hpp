#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <string>

namespace x402::store {

/*
  Records are persisted as protobuf JSON so the KV contents stay readable with
  any sqlite shell.
*/

inline std::string EncodeRecord(const google::protobuf::Message& record) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(record, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode " + record.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

template <typename Record>
Record DecodeRecord(const std::string& json) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  Record record;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &record, options);
  if (!status.ok()) {
    throw std::runtime_error("Corrupt " + record.GetTypeName() + " record: " + std::string(status.message()));
  }
  return record;
}

} // namespace x402::store
