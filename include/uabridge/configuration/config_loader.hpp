#pragma once

#include "config/agent_config.pb.h"

#include <optional>
#include <string>

namespace uabridge::configuration {

/*
  Loads AgentConfig from YAML.

  YAML is converted to JSON, then parsed into the protobuf message, so field
  names and types are checked by protobuf. Unknown keys are errors. Plain
  scalars that look like durations ("500ms", "2m") become protobuf Duration
  strings; quote a scalar to keep it verbatim.

  Throws std::runtime_error on unreadable files and invalid content.
*/
class ConfigLoader {
public:
    static proto::config::AgentConfig LoadFromYaml(const std::string& path);

    static proto::config::AgentConfig LoadFromString(const std::string& yaml);

    /// `--config` value if given, else $CONFIG_FILE, else the packaged default.
    static std::string ResolvePath(const std::optional<std::string>& cli_path);
};

}
