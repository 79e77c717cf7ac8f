#pragma once

#include <google/protobuf/message.h>

#include <string>

#include "config/config.pb.h"

namespace assetxfer::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected. Quoted scalars stay strings, so "0600" keeps its leading zero.
*/
class ConfigLoader {
 public:
  static assetxfer::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same conversion into any message, e.g. a download manifest.
  static void LoadMessageFromYaml(const std::string& path, google::protobuf::Message* message);
};

} // namespace assetxfer::config
