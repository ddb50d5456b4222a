#pragma once

#include <string>
#include <vector>

namespace engram::util {

/*
  List-valued payload fields (skill steps, tags, contradiction ids) are
  stored as JSON arrays through google::protobuf::ListValue.
*/
std::string              EncodeStringList(const std::vector<std::string>& values);
std::vector<std::string> DecodeStringList(const std::string& json);

} // namespace engram::util
