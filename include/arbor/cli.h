#pragma once

#include <CLI/CLI.hpp>

#include <memory>
#include <string>

#include "arbor/config.h"

namespace arbor {

class Cli {
public:
    Cli();
    ~Cli();

    Config::Options parse(int argc, char** argv);

private:
    void add_global_options();
    void add_list_command();
    void add_walk_command();
    void add_stat_command();
    void add_remove_command();
    void add_make_path_command();
    void add_copy_command();
    void finalize();

    std::unique_ptr<CLI::App> app_;
    Config::Options options_{};
    int verbosity_ = 0;
    std::string mode_text_;
};

} // namespace arbor
