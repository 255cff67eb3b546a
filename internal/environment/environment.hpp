#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <string>

#include "crumbtrail/v1/telemetry.pb.h"

namespace crumbtrail::runtime::config {
class AppConfig;
}

namespace crumbtrail::environment {

using EnvironmentProvider = std::function<crumbtrail::v1::Environment()>;

/*
  Describes the host: app identity from config, OS / machine from uname,
  locale from LANG, and a device id persisted under `state_dir` so it
  survives restarts.
*/
crumbtrail::v1::Environment CollectEnvironment(const crumbtrail::runtime::config::AppConfig& app, const std::filesystem::path& state_dir);

// Environment is collected once; the provider hands out copies.
EnvironmentProvider MakeCachedProvider(crumbtrail::v1::Environment environment);

// Flat key/value form used as crash report context.
std::map<std::string, std::string> ToContext(const crumbtrail::v1::Environment& environment);

} // namespace crumbtrail::environment
