#include "pgs_env.h"
#include <fstream>
#include <cstdlib>

bool load_env_file(const pgs_string& filepath, bool overwrite) {
  std::ifstream file(filepath.c_str());
  if (!file.is_open()) {
    return false;
  }

  std::string line;
  while (std::getline(file, line)) {
    pgs_string pgs_line(line);
    pgs_line = pgs_line.trim();

    if (pgs_line.empty() || pgs_line.starts_with("#")) {
      continue;
    }
    if (pgs_line.starts_with("export ")) {
      pgs_line = pgs_line.substr(7).trim();
    }

    size_t pos = pgs_line.find("=");
    if (pos == pgs_string::npos) {
      continue;
    }

    pgs_string key = pgs_line.substr(0, pos).trim();
    pgs_string value = pgs_line.substr(pos + 1).trim();

    // Strip one level of matching quotes
    if (value.size() >= 2 && (value[0] == '"' || value[0] == '\'') && value[value.size() - 1] == value[0]) {
      value = value.substr(1, value.size() - 2);
    }

    if (key.empty()) {
      continue;
    }
    setenv(key.c_str(), value.c_str(), overwrite ? 1 : 0);
  }
  return true;
}

pgs_string env_value(const pgs_string& key, const pgs_string& def) {
  const char* value = std::getenv(key.c_str());
  if (value == nullptr || value[0] == '\0') {
    return def;
  }
  return pgs_string(value);
}
