#pragma once

#include <cerrno>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "arbor/error.h"
#include "arbor/filesystem.h"

namespace arbor::test {

enum class Primitive {
    Stat,
    ReadDirectory,
    MakeDirectory,
    RemoveDirectory,
    RemoveFile,
    OpenRead,
    OpenWrite,
    Read,
    Write
};

// Delegates to a real filesystem, failing chosen primitives on chosen paths
// and recording what was called.
class FaultFileSystem final : public FileSystem {
public:
    explicit FaultFileSystem(FileSystem& inner)
        : inner_{inner} {}

    void fail(Primitive primitive, const std::filesystem::path& path, int error_number) {
        faults_[{primitive, path.string()}] = error_number;
    }

    std::size_t calls(Primitive primitive) const {
        auto it = calls_.find(primitive);
        return it == calls_.end() ? 0 : it->second;
    }

    // "rmdir <path>", "unlink <path>", "mkdir <path>", "cancel-read <path>",
    // "cancel-write <path>", "finish <path>" in call order.
    const std::vector<std::string>& events() const { return events_; }

    bool has_event(const std::string& event) const {
        for (const auto& recorded : events_) {
            if (recorded == event) {
                return true;
            }
        }
        return false;
    }

    NodeRecord stat(const std::filesystem::path& path, LinkMode links) override {
        check(Primitive::Stat, path, "stat");
        return inner_.stat(path, links);
    }

    std::vector<std::string> read_directory(const std::filesystem::path& path) override {
        check(Primitive::ReadDirectory, path, "opendir");
        return inner_.read_directory(path);
    }

    void make_directory(const std::filesystem::path& path, std::uint32_t mode) override {
        check(Primitive::MakeDirectory, path, "mkdir");
        inner_.make_directory(path, mode);
        events_.push_back("mkdir " + path.string());
    }

    void remove_directory(const std::filesystem::path& path) override {
        check(Primitive::RemoveDirectory, path, "rmdir");
        inner_.remove_directory(path);
        events_.push_back("rmdir " + path.string());
    }

    void remove_file(const std::filesystem::path& path) override {
        check(Primitive::RemoveFile, path, "unlink");
        inner_.remove_file(path);
        events_.push_back("unlink " + path.string());
    }

    std::unique_ptr<ReadStream> open_read(const std::filesystem::path& path) override {
        check(Primitive::OpenRead, path, "open");
        return std::make_unique<Reader>(*this, inner_.open_read(path), path);
    }

    std::unique_ptr<WriteStream> open_write(const std::filesystem::path& path, std::uint32_t mode) override {
        check(Primitive::OpenWrite, path, "open");
        return std::make_unique<Writer>(*this, inner_.open_write(path, mode), path);
    }

private:
    class Reader final : public ReadStream {
    public:
        Reader(FaultFileSystem& owner, std::unique_ptr<ReadStream> inner, std::filesystem::path path)
            : owner_{owner}, inner_{std::move(inner)}, path_{std::move(path)} {}

        std::size_t read(std::span<char> buffer) override {
            owner_.check(Primitive::Read, path_, "read");
            return inner_->read(buffer);
        }

        void cancel() noexcept override {
            owner_.events_.push_back("cancel-read " + path_.string());
            inner_->cancel();
        }

    private:
        FaultFileSystem& owner_;
        std::unique_ptr<ReadStream> inner_;
        std::filesystem::path path_;
    };

    class Writer final : public WriteStream {
    public:
        Writer(FaultFileSystem& owner, std::unique_ptr<WriteStream> inner, std::filesystem::path path)
            : owner_{owner}, inner_{std::move(inner)}, path_{std::move(path)} {}

        void write(std::span<const char> data) override {
            owner_.check(Primitive::Write, path_, "write");
            inner_->write(data);
        }

        void finish() override {
            inner_->finish();
            owner_.events_.push_back("finish " + path_.string());
        }

        void cancel() noexcept override {
            owner_.events_.push_back("cancel-write " + path_.string());
            inner_->cancel();
        }

    private:
        FaultFileSystem& owner_;
        std::unique_ptr<WriteStream> inner_;
        std::filesystem::path path_;
    };

    void check(Primitive primitive, const std::filesystem::path& path, const char* operation) {
        ++calls_[primitive];
        auto it = faults_.find({primitive, path.string()});
        if (it != faults_.end()) {
            throw Error::from_errno(it->second, operation, path);
        }
    }

    FileSystem& inner_;
    std::map<std::pair<Primitive, std::string>, int> faults_;
    std::map<Primitive, std::size_t> calls_;
    std::vector<std::string> events_;
};

} // namespace arbor::test
