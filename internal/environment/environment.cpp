#include "environment.hpp"

#include <sys/utsname.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

namespace crumbtrail::environment {

using crumbtrail::observability::StringField;
using crumbtrail::v1::Environment;

namespace {

constexpr char kDeviceIdFile[] = "device_id";

std::string LoadOrCreateDeviceId(const std::filesystem::path& state_dir) {
  const auto file = state_dir / kDeviceIdFile;

  std::ifstream in(file);
  if (in.is_open()) {
    std::string line;
    if (std::getline(in, line) && !line.empty()) {
      try {
        (void)crumbtrail::util::FromString(line);
        return line;
      } catch (const std::invalid_argument& e) {
        CRUMBTRAIL_LOG_WARN("Replacing invalid device id", {StringField("path", file.string()), StringField("error", e.what())});
      }
    }
  }

  auto            id = crumbtrail::util::ToString(crumbtrail::util::GenerateUUID());
  std::error_code ec;
  std::filesystem::create_directories(state_dir, ec);
  std::ofstream out(file, std::ios::trunc);
  if (out.is_open()) {
    out << id;
  } else {
    CRUMBTRAIL_LOG_WARN("Cannot persist device id", {StringField("path", file.string())});
  }
  return id;
}

// "en_US.UTF-8" -> ("en", "US")
void ParseLocale(const char* lang, Environment* env) {
  if (!lang) return;
  std::string locale(lang);
  auto        dot = locale.find('.');
  if (dot != std::string::npos) locale.resize(dot);
  if (locale.empty() || locale == "C" || locale == "POSIX") return;

  auto underscore = locale.find('_');
  env->set_language(locale.substr(0, underscore));
  if (underscore != std::string::npos) {
    env->set_country(locale.substr(underscore + 1));
  }
}

} // namespace

Environment CollectEnvironment(const crumbtrail::runtime::config::AppConfig& app, const std::filesystem::path& state_dir) {
  Environment env;
  env.set_package_name(app.package_name());
  env.set_app_version(app.app_version());
  env.set_app_version_name(app.app_version_name());
  env.set_device_id(LoadOrCreateDeviceId(state_dir));

  struct utsname u;
  if (uname(&u) == 0) {
    env.set_manufacturer(u.sysname);
    env.set_os_version(u.release);
    env.set_model(u.machine);
  }

  ParseLocale(std::getenv("LANG"), &env);
  return env;
}

EnvironmentProvider MakeCachedProvider(Environment environment) {
  return [environment = std::move(environment)] { return environment; };
}

std::map<std::string, std::string> ToContext(const Environment& environment) {
  std::map<std::string, std::string> context;
  auto put = [&](const char* key, const std::string& value) {
    if (!value.empty()) context[key] = value;
  };

  put("package_name", environment.package_name());
  if (environment.app_version() != 0) {
    context["app_version"] = std::to_string(environment.app_version());
  }
  put("app_version_name", environment.app_version_name());
  put("device_id", environment.device_id());
  put("os_version", environment.os_version());
  put("manufacturer", environment.manufacturer());
  put("model", environment.model());
  put("country", environment.country());
  put("language", environment.language());
  return context;
}

} // namespace crumbtrail::environment
