#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "arbor/logger.h"

namespace arbor {

class Config {
public:
    enum class Command {
        None,
        List,
        Walk,
        Stat,
        Remove,
        MakePath,
        Copy
    };

    struct Options {
        Command command = Command::None;

        // Base for every relative path; empty means the process's current directory.
        std::filesystem::path working_directory;

        std::uint32_t directory_mode = 0777;
        std::uint32_t file_mode = 0666;
        std::size_t copy_chunk_size = 32768;
        Logger::Level log_level = Logger::Level::Error;

        bool recursive = true;
        bool details = false;
        bool follow_links = true;
        bool keep_going = false;

        std::vector<std::filesystem::path> paths;
    };

    static Config& instance();

    void set_options(Options options);
    const Options& options() const noexcept;

    // The process-wide working directory, falling back to the current directory.
    std::filesystem::path working_directory() const;

    void set_program_name(std::string_view name);
    std::string_view program_name() const noexcept;

private:
    Config() = default;

    Options options_{};
    std::string program_name_;
};

} // namespace arbor
