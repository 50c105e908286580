#include "warden/runtime_env.hpp"

#include "warden/exceptions.hpp"

#include <cstdlib>

namespace warden
{

namespace fs = std::filesystem;

fs::path runtime_bin_dir(const fs::path& root)
{
    std::error_code ec;
    if (!fs::is_directory(root, ec))
        throw LaunchError("Runtime environment not found: " + root.string());

    for (const char* sub : {"bin", "Scripts"})
    {
        fs::path candidate = root / sub;
        if (fs::is_directory(candidate, ec))
            return candidate;
    }
    throw LaunchError("Runtime environment " + root.string() + " has no bin directory");
}

ChildEnvironment build_child_environment(const Settings& settings)
{
    ChildEnvironment env;
    env.set = settings.environment;

    std::string path;
    auto explicit_path = settings.environment.find("PATH");
    if (explicit_path != settings.environment.end())
        path = explicit_path->second;
    else if (const char* inherited = std::getenv("PATH"))
        path = inherited;
    else
        path = "/usr/local/bin:/usr/bin:/bin";

    if (!settings.runtime_env.empty())
    {
        fs::path root = settings.runtime_env;
        if (root.is_relative() && !settings.working_directory.empty())
            root = fs::path(settings.working_directory) / root;
        root = fs::absolute(root).lexically_normal();

        fs::path bin = runtime_bin_dir(root);
        path = path.empty() ? bin.string() : bin.string() + ":" + path;
        env.set["VIRTUAL_ENV"] = root.string();
        env.unset.push_back("PYTHONHOME");
    }

    env.set["PATH"] = path;
    env.search_path = path;
    return env;
}

} // namespace warden
