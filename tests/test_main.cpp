#include "../utils/pgs_env.h"
#include <filesystem>

static void load_test_environment() {
  std::filesystem::path test_dir = std::filesystem::path(__FILE__).parent_path();
  std::filesystem::path project_root = test_dir.parent_path();
  std::filesystem::path env_file = project_root / ".env";

  if (std::filesystem::exists(env_file)) {
    load_env_file(pgs_string(env_file.string()));
  }
}

struct EnvironmentLoader {
  EnvironmentLoader() { load_test_environment(); }
};
static EnvironmentLoader env_loader;

// Catch2WithMain supplies main(), this file only prepares the environment
