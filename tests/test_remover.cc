#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <string>
#include <vector>

#include "arbor/error.h"
#include "arbor/filesystem.h"
#include "arbor/lister.h"
#include "arbor/probe.h"
#include "arbor/remover.h"
#include "arbor/walker.h"
#include "support/fault_filesystem.h"
#include "support/temp_tree.h"

namespace fs = std::filesystem;
using namespace arbor;

class RecursiveRemoverTest : public test::TempTreeTest {
protected:
    void SetUp() override {
        TempTreeTest::SetUp();
        tree_ = make_dir("tree");
        write_file("tree/a.txt", "a");
        write_file("tree/sub/b.txt", "b");
        write_file("tree/sub/deeper/c.txt", "c");
        make_dir("tree/empty");
    }

    std::size_t event_index(const std::string& event) const {
        const auto& events = faults_.events();
        return static_cast<std::size_t>(std::find(events.begin(), events.end(), event) - events.begin());
    }

    fs::path tree_;
    test::FaultFileSystem faults_{default_filesystem()};
    NodeProbe probe_{faults_};
    TreeWalker walker_{faults_, probe_};
    Lister lister_{walker_};
    RecursiveRemover remover_{faults_, lister_};
};

TEST_F(RecursiveRemoverTest, RemovesTheWholeSubtreeIncludingRoot) {
    EXPECT_EQ(remover_.remove_tree(tree_), 7u);
    EXPECT_FALSE(fs::exists(tree_));
    EXPECT_TRUE(fs::exists(root_));

    try {
        lister_.list(tree_);
        FAIL() << "expected NotFound";
    } catch (const Error& error) {
        EXPECT_EQ(error.kind(), ErrorKind::NotFound);
    }
}

TEST_F(RecursiveRemoverTest, ChildrenGoBeforeTheirParents) {
    remover_.remove_tree(tree_);

    EXPECT_LT(event_index("unlink " + path("tree/sub/deeper/c.txt").string()),
              event_index("rmdir " + path("tree/sub/deeper").string()));
    EXPECT_LT(event_index("rmdir " + path("tree/sub/deeper").string()),
              event_index("rmdir " + path("tree/sub").string()));
    EXPECT_LT(event_index("unlink " + path("tree/sub/b.txt").string()),
              event_index("rmdir " + path("tree/sub").string()));
    EXPECT_EQ(faults_.events().back(), "rmdir " + tree_.string());
}

TEST_F(RecursiveRemoverTest, InaccessibleNodeAbortsBeforeAnyDeletion) {
    faults_.fail(test::Primitive::Stat, path("tree/sub/b.txt"), EACCES);
    try {
        remover_.remove_tree(tree_);
        FAIL() << "expected AccessDenied";
    } catch (const Error& error) {
        EXPECT_EQ(error.kind(), ErrorKind::AccessDenied);
    }
    EXPECT_TRUE(faults_.events().empty());
    EXPECT_TRUE(fs::exists(path("tree/a.txt")));
    EXPECT_TRUE(fs::exists(path("tree/sub/deeper/c.txt")));
}

TEST_F(RecursiveRemoverTest, DeletionFailureMidwayIsAPartialFailure) {
    faults_.fail(test::Primitive::RemoveDirectory, path("tree/sub"), EIO);
    try {
        remover_.remove_tree(tree_);
        FAIL() << "expected PartialFailure";
    } catch (const Error& error) {
        EXPECT_EQ(error.kind(), ErrorKind::PartialFailure);
        EXPECT_EQ(error.cause(), ErrorKind::IOError);
        EXPECT_EQ(error.path(), path("tree/sub"));
        EXPECT_GT(error.completed(), 0u);
        EXPECT_EQ(error.completed(), faults_.events().size());
    }
    EXPECT_FALSE(fs::exists(path("tree/sub/b.txt")));
    EXPECT_TRUE(fs::exists(path("tree/sub")));
    EXPECT_TRUE(fs::exists(tree_));
}

TEST_F(RecursiveRemoverTest, FailureOnTheFirstDeletionKeepsItsKind) {
    // c.txt is the deepest node, so it is removed first.
    faults_.fail(test::Primitive::RemoveFile, path("tree/sub/deeper/c.txt"), EACCES);
    try {
        remover_.remove_tree(tree_);
        FAIL() << "expected AccessDenied";
    } catch (const Error& error) {
        EXPECT_EQ(error.kind(), ErrorKind::AccessDenied);
    }
    EXPECT_TRUE(faults_.events().empty());
}

TEST_F(RecursiveRemoverTest, RemovesASingleFile) {
    EXPECT_EQ(remover_.remove_tree(path("tree/a.txt")), 1u);
    EXPECT_FALSE(fs::exists(path("tree/a.txt")));
    EXPECT_TRUE(fs::exists(path("tree/sub/b.txt")));
}

TEST_F(RecursiveRemoverTest, SymlinkedDirectoryIsUnlinkedNotEmptied) {
    auto outside = write_file("outside/keep.txt", "keep").parent_path();
    fs::create_directory_symlink(outside, path("tree/link"));

    remover_.remove_tree(tree_);
    EXPECT_FALSE(fs::exists(tree_));
    EXPECT_TRUE(fs::exists(path("outside/keep.txt")));
    EXPECT_TRUE(faults_.has_event("unlink " + path("tree/link").string()));
}

TEST_F(RecursiveRemoverTest, NonRecursiveRemovalStopsAtNonEmptyDirectories) {
    EXPECT_THROW(remover_.remove_tree(tree_, false), Error);
    EXPECT_TRUE(fs::exists(path("tree/sub/b.txt")));
}

TEST_F(RecursiveRemoverTest, NonRecursiveRemovalOfAFlatDirectory) {
    auto flat = make_dir("flat");
    write_file("flat/1", "");
    write_file("flat/2", "");
    EXPECT_EQ(remover_.remove_tree(flat, false), 3u);
    EXPECT_FALSE(fs::exists(flat));
}

TEST_F(RecursiveRemoverTest, MissingRootIsNotFound) {
    try {
        remover_.remove_tree(path("absent"));
        FAIL() << "expected NotFound";
    } catch (const Error& error) {
        EXPECT_EQ(error.kind(), ErrorKind::NotFound);
    }
}
