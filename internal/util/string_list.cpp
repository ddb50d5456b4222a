#include "internal/util/string_list.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace engram::util {

std::string EncodeStringList(const std::vector<std::string>& values) {
  google::protobuf::ListValue list;
  for (const auto& value : values) {
    list.add_values()->set_string_value(value);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    throw InvalidArgument("Failed to encode string list: " + std::string(status.message()));
  }
  return json;
}

std::vector<std::string> DecodeStringList(const std::string& json) {
  if (json.empty()) return {};

  google::protobuf::ListValue list;
  auto                        status = google::protobuf::util::JsonStringToMessage(json, &list);
  if (!status.ok()) {
    throw InvalidArgument("Failed to decode string list: " + std::string(status.message()));
  }

  std::vector<std::string> values;
  values.reserve(list.values_size());
  for (const auto& value : list.values()) {
    if (value.kind_case() == google::protobuf::Value::kStringValue) {
      values.push_back(value.string_value());
    }
  }
  return values;
}

} // namespace engram::util
