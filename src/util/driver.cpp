#include <reclint/driver.hpp>
#include <reclint/check.hpp>
#include <reclint/log.hpp>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <set>
#include <sstream>
#include <thread>
#include <tuple>

namespace reclint {

namespace fs = std::filesystem;

static std::string display_path(const fs::path& file, const fs::path& root) {
    fs::path rel = file.lexically_relative(root);
    if (rel.empty() || *rel.begin() == "..") return file.string();
    return rel.string();
}

// Rule kinds checked by a registered Validator rather than in-process.
static bool needs_validator(const Rule& rule) {
    return rule.as<DocRule>() || rule.as<CommentRule>() ||
           rule.as<TestNameRule>() || rule.as<TestExistenceRule>();
}

static Result<std::string> read_text_file(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return ReclintError{ReclintError::IO, "cannot read file"};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return ReclintError{ReclintError::IO, "read error"};
    }
    std::string content = ss.str();
    if (!is_valid_utf8(content)) {
        return ReclintError{ReclintError::IO, "file is not valid UTF-8 text"};
    }
    return Result<std::string>::ok(std::move(content));
}

// ---------------------------------------------------------------------------
// Per-file validation
// ---------------------------------------------------------------------------

static Status check_rule(const fs::path& file, const std::string& rel,
                         const std::string& content, const Rule& rule,
                         const CollectedRuleSet& rules, const ValidatorRegistry& registry,
                         std::vector<Violation>& out) {
    if (const auto* text = rule.as<TextRule>()) {
        for (auto& hit : check_text(content, *text)) {
            Violation v{rel, hit.line, hit.col, rule.message()};
            v.line_text = std::move(hit.line_text);
            out.push_back(std::move(v));
        }
        return ok_status();
    }

    if (const auto* regex = rule.as<RegexRule>()) {
        for (auto& hit : check_regex(content, *regex)) {
            Violation v{rel, hit.line, hit.col, rule.message()};
            v.line_text = std::move(hit.line_text);
            out.push_back(std::move(v));
        }
        return ok_status();
    }

    if (const auto* cmd = rule.as<CommandRule>()) {
        auto outcome = check_command(file, *cmd);
        if (outcome.is_err()) return std::move(outcome).error();
        if (outcome.value()) {
            Violation v{rel, 0, 0, rule.message()};
            if (!outcome.value()->empty()) v.detail = *outcome.value();
            out.push_back(std::move(v));
        }
        return ok_status();
    }

    const Validator* validator = registry.find(rule.type_name());
    if (!validator) return ok_status();

    auto findings = validator->validate(file, content, rule, rules.root_dir);
    if (findings.is_err()) return std::move(findings).error();
    for (auto& f : findings.value()) {
        Violation v{rel, f.line, f.line == 0 ? 0 : f.col, rule.message()};
        if (!f.found.empty()) v.found = std::move(f.found);
        out.push_back(std::move(v));
    }
    return ok_status();
}

FileReport validate_file(const fs::path& file, const CollectedRuleSet& rules,
                         const ValidatorRegistry& registry) {
    FileReport report;

    auto content = read_text_file(file);
    if (content.is_err()) {
        report.errors.push_back(std::move(content).error());
        return report;
    }

    std::string rel = display_path(file, rules.root_dir);
    for (const auto& [category, entries] : rules.rules) {
        for (const auto& entry : entries) {
            const Rule& rule = *entry.rule;
            if (!rule.applies_to(file)) continue;

            auto status = check_rule(file, rel, content.value(), rule, rules, registry,
                                     report.violations);
            if (status.is_err()) {
                auto err = std::move(status).error();
                err.message = "Rule '" + rule.label() + "': " + err.message;
                report.errors.push_back(std::move(err));
            }
        }
    }
    return report;
}

// ---------------------------------------------------------------------------
// Expansion
// ---------------------------------------------------------------------------

static bool accept_file(const fs::path& file, const RootConfig& cfg) {
    return !is_reclint_config_file(file) && cfg.should_include_extension(file);
}

static bool skip_dir(const std::string& name, const RootConfig& cfg) {
    return name == ".git" || cfg.should_exclude_dir(name);
}

// Name of a directory input as written, ignoring a trailing separator.
static std::string input_dir_name(const fs::path& input) {
    fs::path p = input.lexically_normal();
    if (p.filename().empty()) p = p.parent_path();
    return p.filename().string();
}

std::vector<fs::path> expand_paths(const std::vector<fs::path>& inputs,
                                   const RootConfig& root_config,
                                   std::vector<std::string>& errors) {
    std::vector<fs::path> files;
    std::set<fs::path> seen;
    auto add = [&](const fs::path& p) {
        std::error_code ec;
        fs::path canon = fs::canonical(p, ec);
        if (ec) canon = p;
        if (seen.insert(canon).second) files.push_back(canon);
    };

    for (const auto& input : inputs) {
        std::error_code ec;
        if (fs::is_regular_file(input, ec)) {
            if (accept_file(input, root_config)) add(input);
            continue;
        }
        if (!fs::is_directory(input, ec)) {
            errors.push_back(input.string() + ": no such file or directory");
            continue;
        }
        if (skip_dir(input_dir_name(input), root_config)) continue;

        fs::recursive_directory_iterator it(input, fs::directory_options::skip_permission_denied, ec);
        fs::recursive_directory_iterator end;
        if (ec) {
            errors.push_back(input.string() + ": " + ec.message());
            continue;
        }
        for (; it != end; it.increment(ec)) {
            if (ec) {
                errors.push_back(input.string() + ": " + ec.message());
                break;
            }
            const auto& entry = *it;
            std::error_code fec;
            if (entry.is_symlink(fec)) continue;
            if (entry.is_directory(fec)) {
                std::string name = entry.path().filename().string();
                if (skip_dir(name, root_config)) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (entry.is_regular_file(fec) && accept_file(entry.path(), root_config)) {
                add(entry.path());
            }
        }
    }
    return files;
}

// ---------------------------------------------------------------------------
// Sorting and formatting
// ---------------------------------------------------------------------------

void sort_violations(std::vector<Violation>& violations, SortMode mode) {
    if (mode == SortMode::Rule) {
        std::stable_sort(violations.begin(), violations.end(),
            [](const Violation& a, const Violation& b) {
                return std::tie(a.message, a.file, a.line, a.col) <
                       std::tie(b.message, b.file, b.line, b.col);
            });
    } else {
        std::stable_sort(violations.begin(), violations.end(),
            [](const Violation& a, const Violation& b) {
                return std::tie(a.file, a.line, a.col, a.message) <
                       std::tie(b.file, b.line, b.col, b.message);
            });
    }
}

std::string format_violation(const Violation& v, SortMode mode) {
    std::string found = v.found ? " [ found: " + *v.found + " ]" : "";
    std::string location = v.file;
    if (v.line != 0) {
        location += ":" + std::to_string(v.line) + ":" + std::to_string(v.col);
    }
    if (mode == SortMode::Rule) {
        return v.message + ": " + location + found;
    }
    return location + ": " + v.message + found;
}

std::vector<std::string> ValidationReport::lines() const {
    std::vector<std::string> out = errors;
    for (const auto& v : violations) {
        out.push_back(format_violation(v, sort));
        if (v.detail) out.push_back(*v.detail);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Driver
// ---------------------------------------------------------------------------

static RootConfig first_root_config(const std::vector<fs::path>& paths) {
    for (const auto& p : paths) {
        auto root = find_root(p);
        if (root.is_err()) continue;
        auto cfg = RootConfig::load(root.value() / ROOT_MARKER_FILE);
        if (cfg.is_ok()) return cfg.value();
        log::debug("skipping root config of %s: %s",
                   root.value().string().c_str(), cfg.error().message.c_str());
    }
    return RootConfig{};
}

static unsigned worker_count(unsigned jobs, size_t files) {
    unsigned n = jobs;
    if (n == 0) {
        n = std::thread::hardware_concurrency();
        if (n == 0) n = 4;
    }
    if (files < n) n = static_cast<unsigned>(files);
    return n;
}

Result<ValidationReport> validate_paths(const std::vector<fs::path>& paths,
                                        const ValidateOptions& opts,
                                        const ValidatorRegistry& registry) {
    if (paths.empty()) {
        return ReclintError{ReclintError::InvalidArg, "no paths to validate"};
    }

    ValidationReport report;
    report.sort = opts.sort;

    RootConfig root_config = first_root_config(paths);
    std::vector<fs::path> files = expand_paths(paths, root_config, report.errors);
    log::debug("expanded %zu input path(s) to %zu file(s)", paths.size(), files.size());

    // Setup: resolve each distinct parent directory once.
    std::set<fs::path> dirs;
    for (const auto& f : files) dirs.insert(f.parent_path());

    HierarchyResolver resolver;
    std::map<fs::path, CollectedRuleSet> cache;
    for (const auto& dir : dirs) {
        auto set = resolver.resolve(dir);
        if (set.is_err()) {
            if (set.error().is_fatal()) return std::move(set).error();
            std::string msg = dir.string() + ": " + set.error().message;
            log::warn("%s", msg.c_str());
            report.errors.push_back(std::move(msg));
            continue;
        }
        cache.emplace(dir, std::move(set).value());
    }
    log::debug("resolved %zu director%s from %zu rule file(s)", dirs.size(),
               dirs.size() == 1 ? "y" : "ies", resolver.loaded_rule_files());

    std::set<const Rule*> reported;
    for (const auto& [dir, set] : cache) {
        for (const auto& [category, entries] : set.rules) {
            for (const auto& entry : entries) {
                const Rule* rule = entry.rule.get();
                if (!needs_validator(*rule) || registry.find(rule->type_name())) continue;
                if (!reported.insert(rule).second) continue;
                std::string msg = "Rule '" + rule->label() + "': no validator registered for type '" +
                                  rule->type_name() + "'";
                log::warn("%s", msg.c_str());
                report.errors.push_back(std::move(msg));
            }
        }
    }

    // Parallel phase. The cache is read-only from here on and every worker
    // writes only its own result slots.
    std::vector<const CollectedRuleSet*> file_rules(files.size(), nullptr);
    for (size_t i = 0; i < files.size(); ++i) {
        auto it = cache.find(files[i].parent_path());
        if (it != cache.end()) file_rules[i] = &it->second;
    }

    std::vector<FileReport> results(files.size());
    std::atomic<size_t> next_index{0};
    auto worker = [&]() {
        while (true) {
            size_t index = next_index.fetch_add(1);
            if (index >= files.size()) break;
            if (!file_rules[index]) continue;
            results[index] = validate_file(files[index], *file_rules[index], registry);
        }
    };

    unsigned n_workers = worker_count(opts.jobs, files.size());
    if (n_workers <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(n_workers);
        for (unsigned t = 0; t < n_workers; ++t) threads.emplace_back(worker);
        for (auto& t : threads) t.join();
    }

    for (size_t i = 0; i < files.size(); ++i) {
        if (!file_rules[i]) continue;
        ++report.files_checked;
        std::string rel = display_path(files[i], file_rules[i]->root_dir);
        for (const auto& err : results[i].errors) {
            std::string msg = rel + ": " + err.message;
            log::warn("%s", msg.c_str());
            report.errors.push_back(std::move(msg));
        }
        for (auto& v : results[i].violations) {
            report.violations.push_back(std::move(v));
        }
    }

    std::sort(report.errors.begin(), report.errors.end());
    sort_violations(report.violations, opts.sort);

    log::info("checked %zu file(s) with %u worker(s): %zu violation(s), %zu error(s)",
              report.files_checked, n_workers, report.violations.size(), report.errors.size());
    return Result<ValidationReport>::ok(std::move(report));
}

} // namespace reclint
