#pragma once

#include <workon/engine/lifecycle.hpp>
#include <string>
#include <vector>

namespace workon {

// JSON documents for --json output. Absent optional fields are omitted.
std::string prune_report_to_json(const PruneReport& report);
std::string worktrees_to_json(const std::vector<WorktreeSummary>& worktrees);
std::string create_result_to_json(const CreateResult& result);
std::string move_result_to_json(const MoveResult& result);

} // namespace workon
