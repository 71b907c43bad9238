#include <workon/engine/report.hpp>
#include <tomlplusplus/toml.hpp>

#include <cstdint>
#include <sstream>

namespace workon {

static toml::table item_table(const PruneItem& item) {
    toml::table t{
        {"name", item.name},
        {"path", item.path.string()},
        {"dirty", item.dirty},
    };
    if (item.branch) t.insert("branch", *item.branch);
    return t;
}

static toml::table status_table(const WorktreeStatus& st) {
    return toml::table{
        {"detached", st.is_detached},
        {"dirty", st.is_dirty},
        {"unpushed", st.has_unpushed_commits},
        {"merged", st.is_merged},
        {"behind", st.is_behind},
        {"upstream_gone", st.upstream_gone},
        {"branch_missing", st.branch_missing},
    };
}

static std::string render(const toml::table& doc) {
    std::ostringstream ss;
    ss << toml::json_formatter{doc};
    return ss.str();
}

std::string prune_report_to_json(const PruneReport& report) {
    const PrunePlan& plan = report.plan;

    toml::array remove;
    for (const auto& item : plan.to_remove) {
        toml::table t = item_table(item);
        for (const auto& r : report.results) {
            if (r.item.path != item.path) continue;
            t.insert("removed", r.removed);
            if (!r.removed) t.insert("error", r.error);
        }
        remove.push_back(std::move(t));
    }

    toml::array prot;
    for (const auto& s : plan.skipped_protected) {
        toml::table t = item_table(s.item);
        t.insert("rule", s.rule);
        prot.push_back(std::move(t));
    }

    toml::array unsafe;
    for (const auto& s : plan.skipped_unsafe) {
        toml::table t = item_table(s.item);
        t.insert("reason", unsafe_reason_text(s.reason));
        unsafe.push_back(std::move(t));
    }

    toml::array unmatched;
    for (const auto& n : plan.unmatched_names) unmatched.push_back(n);

    toml::table doc{
        {"dry_run", plan.dry_run},
        {"to_remove", std::move(remove)},
        {"skipped_protected", std::move(prot)},
        {"skipped_unsafe", std::move(unsafe)},
        {"unmatched", std::move(unmatched)},
    };
    return render(doc);
}

std::string worktrees_to_json(const std::vector<WorktreeSummary>& worktrees) {
    toml::array list;
    for (const auto& w : worktrees) {
        toml::table t{
            {"name", w.name},
            {"path", w.entry.path.string()},
            {"head", w.entry.head},
            {"locked", w.entry.locked},
            {"prunable", w.entry.prunable},
            {"status", status_table(w.status)},
        };
        if (w.entry.branch) t.insert("branch", *w.entry.branch);
        list.push_back(std::move(t));
    }

    toml::table doc{{"worktrees", std::move(list)}};
    return render(doc);
}

std::string create_result_to_json(const CreateResult& result) {
    const NameResolution& res = result.resolution;

    toml::array copied;
    for (const auto& f : result.copied_files) copied.push_back(f);

    toml::array hooks;
    for (const auto& h : result.hooks) {
        toml::table t{
            {"command", h.command},
            {"success", h.success},
            {"exit_code", h.exit_code},
        };
        if (!h.message.empty()) t.insert("message", h.message);
        hooks.push_back(std::move(t));
    }

    toml::array warnings;
    for (const auto& w : result.warnings) warnings.push_back(w);

    toml::table doc{
        {"name", res.branch_name},
        {"path", res.worktree_path.string()},
        {"mode", mode_name(res.mode)},
        {"copied", std::move(copied)},
        {"hooks", std::move(hooks)},
        {"warnings", std::move(warnings)},
    };
    if (const auto* pr = std::get_if<PrTrackingMode>(&res.mode)) {
        doc.insert("pull_request", static_cast<int64_t>(pr->number));
    }
    if (result.base_branch) doc.insert("base", *result.base_branch);
    return render(doc);
}

std::string move_result_to_json(const MoveResult& result) {
    toml::table doc{
        {"from", toml::table{{"branch", result.from_branch},
                             {"path", result.from_path.string()}}},
        {"to", toml::table{{"branch", result.to_branch},
                           {"path", result.to_path.string()}}},
        {"dry_run", result.dry_run},
    };
    return render(doc);
}

} // namespace workon
