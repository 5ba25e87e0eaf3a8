#pragma once

#include <string>

// Returns the base config directory used by tomodraw.
//
// "$XDG_CONFIG_HOME/tomodraw", else "$HOME/.config/tomodraw", else ".".
std::string GetTomodrawConfigDir();

// Joins the config dir and a relative path within it.
// Example: TomodrawConfigPath("settings.json") -> "<config_dir>/settings.json"
std::string TomodrawConfigPath(const std::string& relative);
