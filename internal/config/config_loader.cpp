#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace dsnp::config {

namespace {

using dsnp::runtime::config::RuntimeConfig;

bool IsIntegerLiteral(const std::string& text) {
  std::size_t start = (!text.empty() && (text[0] == '-' || text[0] == '+')) ? 1 : 0;
  if (start == text.size()) {
    return false;
  }
  for (std::size_t i = start; i < text.size(); ++i) {
    if (text[i] < '0' || text[i] > '9') {
      return false;
    }
  }
  return true;
}

/*
  Scalar mapping:

    quoted            → string
    true / false      → bool
    integer literal   → string holding the exact digits
    other number      → number
    anything else     → string

  Integers stay textual so 64-bit counts and unquoted user ids survive the
  trip through JSON; the protobuf JSON parser accepts decimal strings for
  every integer field.
*/
void SetScalar(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& text = node.Scalar();

  if (node.Tag() == "!") {
    value->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    value->set_bool_value(text == "true");
    return;
  }

  if (IsIntegerLiteral(text)) {
    value->set_string_value(text);
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (!text.empty() && end && *end == '\0') {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(text);
}

void ToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalar(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* items = value->mutable_list_value();
      for (const auto& item : node) {
        ToProtoValue(item, items->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        ToProtoValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

RuntimeConfig ToRuntimeConfig(const YAML::Node& document) {
  RuntimeConfig config;

  // an empty document is an all-defaults config
  if (document.IsNull()) {
    return config;
  }
  if (!document.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value tree;
  ToProtoValue(document, &tree);

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(tree, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node document;
  try {
    document = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }

  return ToRuntimeConfig(document);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node document;
  try {
    document = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ToRuntimeConfig(document);
}

} // namespace dsnp::config
