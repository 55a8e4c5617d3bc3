#pragma once

#include <string>

// Loads both rasters, runs the match phases and writes the artifacts into
// out_dir. Returns a process exit code.
int run_match_command(const std::string &template_path,
                      const std::string &search_path,
                      const std::string &config_path,
                      const std::string &out_dir,
                      const std::string &run_id_override);
