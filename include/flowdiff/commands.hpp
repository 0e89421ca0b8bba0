#pragma once

#include "config.hpp"
#include <string>

namespace flowdiff {

// Command handlers
int cmd_analyze(const std::string &path, const AnalysisConfig &config);
int cmd_entry_points(const std::string &path, const AnalysisConfig &config);
int cmd_diff(const std::string &path, const std::string &before_ref, const std::string &after_ref,
             const AnalysisConfig &config, bool summary_only);

} // namespace flowdiff
