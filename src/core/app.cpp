#include "arbor/app.h"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "arbor/cli.h"
#include "arbor/config.h"
#include "arbor/copier.h"
#include "arbor/creator.h"
#include "arbor/error.h"
#include "arbor/filesystem.h"
#include "arbor/lister.h"
#include "arbor/logger.h"
#include "arbor/perf.h"
#include "arbor/probe.h"
#include "arbor/remover.h"
#include "arbor/renderer.h"
#include "arbor/walker.h"

namespace arbor {

class App::Impl {
public:
    Impl()
        : filesystem_{default_filesystem()},
          probe_{filesystem_},
          walker_{filesystem_, probe_},
          lister_{walker_},
          remover_{filesystem_, lister_},
          creator_{filesystem_, probe_} {}

    int run(int argc, char** argv) {
        Cli cli;
        auto options = cli.parse(argc, argv);
        Config::instance().set_program_name(argc > 0 && argv ? argv[0] : "arbor");
        Logger::instance().set_level(options.log_level);

        if (!options.working_directory.empty()) {
            std::error_code ec;
            auto absolute = std::filesystem::absolute(options.working_directory, ec);
            if (!ec) {
                options.working_directory = absolute.lexically_normal();
            }
        }
        Config::instance().set_options(options);

        const auto& config = Config::instance().options();
        Renderer renderer{config, std::cout};
        try {
            perf::ScopedTimer timer{"command"};
            dispatch(config, renderer);
        } catch (const Error& error) {
            Logger::instance().debug("{} failure on {}", to_string(error.kind()), error.path().string());
            std::cerr << Config::instance().program_name() << ": " << error.what() << '\n';
            return 1;
        }
        return 0;
    }

private:
    std::filesystem::path target(const Config::Options& options, std::size_t index) const {
        if (index < options.paths.size()) {
            return options.paths[index];
        }
        return std::filesystem::path{"."};
    }

    void dispatch(const Config::Options& options, Renderer& renderer) {
        const LinkMode links = options.follow_links ? LinkMode::Follow : LinkMode::NoFollow;
        switch (options.command) {
            case Config::Command::List: {
                ListOptions list_options;
                list_options.recursive = options.recursive;
                list_options.details = options.details;
                renderer.render(lister_.list(target(options, 0), list_options));
                break;
            }
            case Config::Command::Walk: {
                WalkOptions walk_options;
                walk_options.recursive = options.recursive;
                walk_options.links = links;
                if (options.keep_going) {
                    walk_options.on_error = [](const Error&) -> std::optional<NodeRecord> { return std::nullopt; };
                }
                walker_.walk(target(options, 0), [&](const std::filesystem::path& path,
                                                     const std::optional<NodeRecord>& record) {
                    renderer.render_visit(path, record);
                }, walk_options);
                break;
            }
            case Config::Command::Stat:
                renderer.render_record(probe_.probe(target(options, 0), links));
                break;
            case Config::Command::Remove: {
                const auto removed = remover_.remove_tree(target(options, 0), options.recursive);
                Logger::instance().info("removed {} nodes", removed);
                break;
            }
            case Config::Command::MakePath: {
                const auto created = creator_.make_tree_path(target(options, 0), options.directory_mode);
                Logger::instance().info("created {} directories", created);
                break;
            }
            case Config::Command::Copy: {
                StreamPump pump{options.copy_chunk_size};
                TreeCopier copier{filesystem_, pump, walker_, creator_};
                if (options.recursive) {
                    const auto files = copier.copy_tree(target(options, 0), target(options, 1));
                    Logger::instance().info("copied {} files", files);
                } else {
                    copier.copy_file(target(options, 0), target(options, 1));
                }
                break;
            }
            case Config::Command::None:
                break;
        }
    }

    FileSystem& filesystem_;
    NodeProbe probe_;
    TreeWalker walker_;
    Lister lister_;
    RecursiveRemover remover_;
    RecursiveCreator creator_;
};

App::App()
    : impl_{std::make_unique<Impl>()} {}

App::~App() = default;

int App::run(int argc, char** argv) {
    return impl_->run(argc, argv);
}

} // namespace arbor
