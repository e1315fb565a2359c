#pragma once

#include <google/protobuf/struct.pb.h>
#include <yaml-cpp/yaml.h>

namespace stateshift::util {

/*
  YAML -> google.protobuf.Value.

  Scalars "true"/"false" become bools, fully numeric scalars become numbers,
  everything else stays a string. Quoted scalars are always strings.
*/
void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

google::protobuf::Value YamlToProtoValue(const YAML::Node& node);

} // namespace stateshift::util
