#pragma once

/// @file warden.hpp
/// @brief Main header for warden - includes the supervisor and its settings
///
/// Usage:
/// @code
/// #include <warden.hpp>
///
/// int main() {
///     warden::Settings settings;
///     settings.name = "uploader";
///     settings.command = {"python", "run.py"};
///     settings.runtime_env = "env";
///
///     warden::Supervisor supervisor(settings);
///     auto proc = supervisor.start();
///     // ... later, from another invocation
///     supervisor.stop();
/// }
/// @endcode

#include "warden/exceptions.hpp"
#include "warden/logging.hpp"
#include "warden/pid_record.hpp"
#include "warden/runtime_env.hpp"
#include "warden/settings.hpp"
#include "warden/supervisor.hpp"
#include "warden/types.hpp"
