#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace assetxfer::config {

namespace {

/*
  YAML → google.protobuf.Value

  `where` is the dotted key path of `node`, used only in error messages.
*/
void ConvertNode(const YAML::Node& node, const std::string& where, google::protobuf::Value* out);

void ConvertScalar(const YAML::Node& node, google::protobuf::Value* out) {
  const std::string& text = node.Scalar();

  // quoted scalars carry the non-specific "!" tag and are always strings
  if (node.Tag() == "!") {
    out->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    out->set_bool_value(text == "true");
    return;
  }

  if (!text.empty()) {
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (end != nullptr && *end == '\0') {
      out->set_number_value(number);
      return;
    }
  }

  out->set_string_value(text);
}

void ConvertMap(const YAML::Node& node, const std::string& where, google::protobuf::Struct* out) {
  auto& fields = *out->mutable_fields();
  for (const auto& entry : node) {
    if (!entry.first.IsScalar()) {
      throw std::runtime_error("non-scalar key at " + (where.empty() ? std::string("<root>") : where));
    }
    const auto& key = entry.first.Scalar();
    ConvertNode(entry.second, where.empty() ? key : where + "." + key, &fields[key]);
  }
}

void ConvertNode(const YAML::Node& node, const std::string& where, google::protobuf::Value* out) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ConvertScalar(node, out);
      return;

    case YAML::NodeType::Sequence: {
      auto*       list  = out->mutable_list_value();
      std::size_t index = 0;
      for (const auto& item : node) {
        ConvertNode(item, where + "[" + std::to_string(index++) + "]", list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map:
      ConvertMap(node, where, out->mutable_struct_value());
      return;

    default:
      throw std::runtime_error("unsupported YAML node at " + (where.empty() ? std::string("<root>") : where));
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

void ConfigLoader::LoadMessageFromYaml(const std::string& path, google::protobuf::Message* message) {
  const std::string type_name = message->GetDescriptor()->name();

  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML file " + path + ": " + std::string(e.what()));
  }

  // An empty document is an empty message, not a null.
  if (yaml.IsNull()) {
    message->Clear();
    return;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid " + type_name + " in " + path + ": top level must be a mapping");
  }

  google::protobuf::Value document;
  try {
    ConvertNode(yaml, "", &document);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error("Invalid " + type_name + " in " + path + ": " + e.what());
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(document, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid " + type_name + " in " + path + ": " + std::string(status.message()));
  }
}

assetxfer::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  assetxfer::runtime::config::RuntimeConfig config;
  LoadMessageFromYaml(path, &config);
  return config;
}

} // namespace assetxfer::config
