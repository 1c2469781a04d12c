#include "arbor/cli.h"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <string_view>

#include "arbor/version.h"

namespace arbor {

namespace {
constexpr std::string_view kDescription =
    "arbor - breadth-first tree walking, listing, removal, creation and copying";

const CLI::Validator kOctalMode{
    [](std::string& input) -> std::string {
        if (input.empty() || input.size() > 4 || input.find_first_not_of("01234567") != std::string::npos) {
            return "mode must be an octal number such as 755";
        }
        return {};
    },
    "OCTAL"};
} // namespace

Cli::Cli()
    : app_{std::make_unique<CLI::App>(std::string{kDescription}, "arbor")} {
    app_->set_version_flag("--version", Version::FullString());
    app_->require_subcommand(1);
    app_->footer(R"(Relative paths resolve against the working directory (-C, default: current directory).

Exit status:
 0  if OK,
 1  if the operation failed (the first unrecoverable error is printed).)");

    add_global_options();
    add_list_command();
    add_walk_command();
    add_stat_command();
    add_remove_command();
    add_make_path_command();
    add_copy_command();
}

Cli::~Cli() = default;

void Cli::add_global_options() {
    app_->add_option("-C,--directory", options_.working_directory, "Resolve relative paths against DIR")
        ->check(CLI::ExistingDirectory);
    app_->add_flag("-v,--verbose", verbosity_, "Increase log verbosity (repeatable)");
    app_->add_option("--chunk-size", options_.copy_chunk_size, "Copy transfer chunk size in bytes")
        ->check(CLI::Range(std::size_t{1}, std::size_t{64} * 1024 * 1024));
}

void Cli::add_list_command() {
    auto* list = app_->add_subcommand("ls", "List the nodes beneath a path, breadth-first");
    list->callback([&]() { options_.command = Config::Command::List; });
    list->add_option("path", options_.paths, "Root to list")->expected(0, 1);
    list->add_flag_callback("--no-recursive", [&]() { options_.recursive = false; },
                            "Only list the immediate children");
    list->add_flag_callback("-l,--long", [&]() { options_.details = true; }, "Print full metadata records");
}

void Cli::add_walk_command() {
    auto* walk = app_->add_subcommand("walk", "Visit every node beneath a path, root first");
    walk->callback([&]() { options_.command = Config::Command::Walk; });
    walk->add_option("path", options_.paths, "Root to walk")->expected(0, 1);
    walk->add_flag_callback("--no-recursive", [&]() { options_.recursive = false; },
                            "Do not descend below the root's children");
    walk->add_flag_callback("-k,--keep-going", [&]() { options_.keep_going = true; },
                            "Report unreadable nodes and continue");
    walk->add_flag_callback("-P,--no-follow", [&]() { options_.follow_links = false; },
                            "Report symbolic links themselves instead of their targets");
    walk->add_flag_callback("-l,--long", [&]() { options_.details = true; }, "Print full metadata records");
}

void Cli::add_stat_command() {
    auto* stat = app_->add_subcommand("stat", "Print the metadata record of one node");
    stat->callback([&]() { options_.command = Config::Command::Stat; });
    stat->add_option("path", options_.paths, "Node to inspect")->required()->expected(1);
    stat->add_flag_callback("-P,--no-follow", [&]() { options_.follow_links = false; },
                            "Inspect a symbolic link itself");
}

void Cli::add_remove_command() {
    auto* remove = app_->add_subcommand("rm", "Remove a subtree, children before parents");
    remove->callback([&]() { options_.command = Config::Command::Remove; });
    remove->add_option("path", options_.paths, "Root to remove")->required()->expected(1);
    remove->add_flag_callback("--no-recursive", [&]() { options_.recursive = false; },
                              "Only remove the root and its immediate children");
}

void Cli::add_make_path_command() {
    auto* make_path = app_->add_subcommand("mkdirp", "Create a directory and every missing ancestor");
    make_path->callback([&]() { options_.command = Config::Command::MakePath; });
    make_path->add_option("path", options_.paths, "Directory to create")->required()->expected(1);
    make_path->add_option("-m,--mode", mode_text_, "Mode of created directories")->check(kOctalMode);
}

void Cli::add_copy_command() {
    auto* copy = app_->add_subcommand("cp", "Copy a file, or a directory tree with -r");
    copy->preparse_callback([&](std::size_t) { options_.recursive = false; });
    copy->callback([&]() { options_.command = Config::Command::Copy; });
    copy->add_option("paths", options_.paths, "Source and destination")->required()->expected(2);
    copy->add_flag_callback("-r,--recursive", [&]() { options_.recursive = true; }, "Copy directories recursively");
}

void Cli::finalize() {
    const int level = std::clamp(static_cast<int>(Logger::Level::Error) + verbosity_,
                                 static_cast<int>(Logger::Level::Error), static_cast<int>(Logger::Level::Trace));
    options_.log_level = static_cast<Logger::Level>(level);
    if (!mode_text_.empty()) {
        options_.directory_mode = static_cast<std::uint32_t>(std::stoul(mode_text_, nullptr, 8));
    }
}

Config::Options Cli::parse(int argc, char** argv) {
    options_ = Config::Options{};
    verbosity_ = 0;
    mode_text_.clear();
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& ex) {
        std::exit(app_->exit(ex));
    }
    finalize();
    return options_;
}

} // namespace arbor
