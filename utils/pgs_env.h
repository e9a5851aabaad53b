#ifndef pgs_ENV_H
#define pgs_ENV_H

#include "pgs_string.h"

// Loads KEY=VALUE lines from a .env file into the process environment.
// Blank lines and lines starting with # are ignored. Existing variables are
// kept unless overwrite is set. Returns false if the file could not be opened.
bool load_env_file(const pgs_string& filepath, bool overwrite = false);

// Reads an environment variable, def if unset or empty
pgs_string env_value(const pgs_string& key, const pgs_string& def = pgs_string());

#endif // pgs_ENV_H
