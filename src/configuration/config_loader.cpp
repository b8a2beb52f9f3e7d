#include "uabridge/configuration/config_loader.hpp"
#include "uabridge/core/constants.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <format>

#include <cstdlib>
#include <stdexcept>

namespace uabridge::configuration {

namespace {

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

// "1500ms" -> "1.500s"; nullopt when the text is not a duration.
std::optional<std::string> NormalizeDuration(const std::string& text) {
    struct DurationUnit {
        std::string_view suffix;
        double seconds;
    };
    static constexpr DurationUnit UNITS[] = {{"ms", 0.001}, {"s", 1.0}, {"m", 60.0}, {"h", 3600.0}};

    for (const auto& unit : UNITS) {
        if (text.size() <= unit.suffix.size() ||
            text.compare(text.size() - unit.suffix.size(), unit.suffix.size(), unit.suffix) != 0) {
            continue;
        }
        const std::string number = text.substr(0, text.size() - unit.suffix.size());
        char* endptr = nullptr;
        const double amount = std::strtod(number.c_str(), &endptr);
        if (endptr == nullptr || *endptr != '\0' || amount < 0) {
            return std::nullopt;
        }
        return std::format("{:.3f}s", amount * unit.seconds);
    }
    return std::nullopt;
}

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
    const std::string& scalar_value = node.Scalar();

    // quoted scalars stay strings
    if (node.Tag() == "!") {
        value->set_string_value(scalar_value);
        return;
    }

    if (scalar_value == "true" || scalar_value == "false") {
        value->set_bool_value(scalar_value == "true");
        return;
    }

    char* endptr = nullptr;
    const double numeric_value = std::strtod(scalar_value.c_str(), &endptr);
    if (!scalar_value.empty() && endptr && *endptr == '\0') {
        value->set_number_value(numeric_value);
        return;
    }

    if (auto duration = NormalizeDuration(scalar_value)) {
        value->set_string_value(*duration);
        return;
    }

    value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
            break;

        case YAML::NodeType::Scalar:
            SetScalarValue(node, value);
            break;

        case YAML::NodeType::Sequence: {
            auto* list_value = value->mutable_list_value();
            for (size_t i = 0; i < node.size(); ++i) {
                YamlToProtoValue(node[i], list_value->add_values());
            }
            break;
        }

        case YAML::NodeType::Map: {
            auto* struct_value = value->mutable_struct_value();
            for (auto it : node) {
                YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
            }
            break;
        }

        default:
            throw std::runtime_error("Unsupported YAML node");
    }
}

proto::config::AgentConfig ParseYamlNode(const YAML::Node& yaml) {
    proto::config::AgentConfig config;
    if (yaml.IsNull()) {
        return config;
    }
    if (!yaml.IsMap()) {
        throw std::runtime_error("Invalid configuration: top level must be a mapping");
    }

    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
        throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
        throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
    return config;
}

}

proto::config::AgentConfig ConfigLoader::LoadFromYaml(const std::string& path) {
    YAML::Node yaml;
    try {
        yaml = YAML::LoadFile(path);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load YAML config " + path + ": " + std::string(e.what()));
    }
    return ParseYamlNode(yaml);
}

proto::config::AgentConfig ConfigLoader::LoadFromString(const std::string& text) {
    YAML::Node yaml;
    try {
        yaml = YAML::Load(text);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
    }
    return ParseYamlNode(yaml);
}

std::string ConfigLoader::ResolvePath(const std::optional<std::string>& cli_path) {
    if (cli_path.has_value() && !cli_path->empty()) {
        return *cli_path;
    }
    const std::string env_name(BridgeDefaults::CONFIG_FILE_ENV);
    if (const char* from_env = std::getenv(env_name.c_str()); from_env != nullptr && *from_env != '\0') {
        return from_env;
    }
    return std::string(BridgeDefaults::CONFIG_FILE_PATH);
}

}
