// demo_validate.cpp
//
// Validates the given files and directories against the rule files found
// above them and prints the report to stdout.  Run it with:
//
//     ./demo_validate                        # no args  -> InvalidArg error
//     ./demo_validate src/                   # walk a directory
//     ./demo_validate a.rs b/ --by-file      # file-ordered output
//
// Settings come from ~/.rec_lint/config.toml and <root>/.rec_lint.toml.
// The exit status is 1 when anything was reported.

#include <reclint/driver.hpp>
#include <reclint/hierarchy.hpp>
#include <reclint/log.hpp>
#include <reclint/settings.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace reclint;

struct DemoArgs {
    std::vector<fs::path> paths;
    bool by_file = false;
};

Result<DemoArgs> parse_args(int argc, char** argv) {
    DemoArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--by-file") {
            args.by_file = true;
        } else {
            args.paths.emplace_back(a);
        }
    }
    if (args.paths.empty()) {
        return ReclintError{
            ReclintError::InvalidArg,
            "no paths to validate",
            "usage: demo_validate <path>... [--by-file]"
        };
    }
    return Result<DemoArgs>::ok(std::move(args));
}

Result<ValidationReport> run(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    RECLINT_TRY(args);

    // Project settings live next to the root marker of the first path.
    Settings settings;
    auto root = find_root(args.value().paths.front());
    if (root.is_ok()) {
        auto loaded = load_effective_settings(root.value());
        RECLINT_TRY(loaded);
        settings = loaded.value();
    }
    settings.apply_logging();

    ValidateOptions opts;
    opts.sort = args.value().by_file ? SortMode::File : settings.sort;
    opts.jobs = settings.jobs;

    log::debug("sorting by %s with jobs = %u", sort_mode_name(opts.sort), opts.jobs);
    return validate_paths(args.value().paths, opts, ValidatorRegistry::with_builtins());
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 2;
    }

    for (const auto& line : result.value().lines()) {
        std::cout << line << "\n";
    }
    return result.value().clean() ? 0 : 1;
}
