#pragma once
// Helpers for reading /proc with optional root remap
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace steward::util {

// Map an absolute /proc path to an alternate root if STEWARD_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Value of a "<Field>:   <n> kB" line of a /proc/<pid>/status text.
auto status_field_kb(std::string_view status, std::string_view field) -> std::optional<uint64_t>;

} // namespace steward::util
