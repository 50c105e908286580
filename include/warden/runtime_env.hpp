#pragma once
#include "warden/settings.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace warden
{

/// Environment changes applied to the child on top of the inherited one
struct ChildEnvironment
{
    std::map<std::string, std::string> set;
    std::vector<std::string> unset;
    /// PATH the child will see, used to resolve the command
    std::string search_path;
};

/// Binary directory of a virtualenv-style runtime directory: bin/, or
/// Scripts/ when only that exists.
/// @throws LaunchError if root or its binary directory is missing
std::filesystem::path runtime_bin_dir(const std::filesystem::path& root);

/// Build the child's environment from settings. With runtime_env set, its
/// binary directory is prepended to PATH and VIRTUAL_ENV is exported, as
/// an activation script would.
/// @throws LaunchError if the runtime environment is missing
ChildEnvironment build_child_environment(const Settings& settings);

} // namespace warden
