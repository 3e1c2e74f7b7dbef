// demo_describe.cpp
//
// Prints the effective rules, review items and guidelines for a directory,
// annotated with the directory that declared each one.  Given a file, the
// review items and guidelines are narrowed to the ones that apply to it:
//
//     ./demo_describe src/module
//     ./demo_describe src/module/Foo.kt
//

#include <reclint/describe.hpp>
#include <reclint/log.hpp>

#include <filesystem>
#include <iostream>

using namespace reclint;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << ReclintError{ReclintError::InvalidArg, "no directory given",
                                  "usage: demo_describe <dir>"}.format() << "\n";
        return 2;
    }

    std::filesystem::path target = argv[1];
    std::error_code ec;
    bool is_file = std::filesystem::is_regular_file(target, ec);

    auto set = resolve_effective_rules(is_file ? target.parent_path() : target);
    if (set.is_err()) {
        std::cerr << set.error().format() << "\n";
        return 1;
    }

    log::info("root: %s", set.value().root_dir.string().c_str());
    for (const auto& line : describe_rules(set.value())) std::cout << line << "\n";
    for (Category c : {Category::Review, Category::Guideline}) {
        auto lines = is_file ? describe_items(set.value(), c, std::filesystem::absolute(target))
                             : describe_items(set.value(), c);
        for (const auto& line : lines) std::cout << line << "\n";
    }
    return 0;
}
