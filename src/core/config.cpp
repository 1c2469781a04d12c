#include "arbor/config.h"

#include <system_error>
#include <utility>

namespace arbor {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::set_options(Options options) {
    options_ = std::move(options);
}

const Config::Options& Config::options() const noexcept {
    return options_;
}

std::filesystem::path Config::working_directory() const {
    if (!options_.working_directory.empty()) {
        return options_.working_directory;
    }
    std::error_code ec;
    auto current = std::filesystem::current_path(ec);
    if (ec) {
        Logger::instance().warn("cannot determine current directory: {}", ec.message());
        return std::filesystem::path{"/"};
    }
    return current;
}

void Config::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

std::string_view Config::program_name() const noexcept {
    return program_name_;
}

} // namespace arbor
