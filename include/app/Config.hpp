#pragma once
#include <cstdint>
#include <string>

#include "governor/ResourceGovernor.hpp"
#include "launch/LaunchConfig.hpp"
#include "perf/PerformanceRecorder.hpp"
#include "util/TomlReader.hpp"

namespace steward::app {

struct StewardConfig {
  launch::LaunchConfig launch;
  governor::GovernorConfig governor;
  perf::RecorderConfig recorder;
  uint16_t metrics_port{0}; // 0 = disabled
  std::string storage_dir;
};

// $STEWARD_CONFIG, else $XDG_CONFIG_HOME/steward/config.toml, else ~/.config/steward/config.toml.
[[nodiscard]] std::string config_file_path();
// $XDG_STATE_HOME/steward, else ~/.local/state/steward, else ./.steward.
[[nodiscard]] std::string default_storage_dir();

// Env lookup accepting STEWARD_X and steward_X.
const char* getenv_compat(const char* name);

// Each setting resolves TOML -> environment -> compiled default.
[[nodiscard]] StewardConfig resolve_config(const util::TomlReader& toml, bool have_toml);
// Reads config_file_path() (a missing file means defaults) and resolves.
[[nodiscard]] StewardConfig load_config();

} // namespace steward::app
