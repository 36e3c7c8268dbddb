#include "fm/merge/engine.hpp"

#include "fm/events/components.hpp"
#include "fm/events/event_bus.hpp"
#include "fm/events/events.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using fm::ErrorCode;
using fm::merge::Conflict;
using fm::merge::EntryKind;
using fm::merge::MergeEngine;
using fm::merge::MergeOptions;
using fm::merge::is_ancestor;
using fm::merge::merge_folders;
using fm::merge::merge_folders_async;
using fm::merge::validate_roots;

namespace {

const std::string kConflictPostfix = " - CONFLICT";

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto base = fs::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto unique = base / fs::path("fm_engine_test_" + std::to_string(id));
    fs::create_directories(unique);
    return unique;
}

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

std::vector<std::string> conflict_paths(const std::vector<Conflict>& conflicts) {
    std::vector<std::string> paths;
    for (const auto& conflict : conflicts) {
        paths.push_back(conflict.relative_path());
    }
    return paths;
}

/// Every path below root (relative, generic form), files and directories alike.
std::set<std::string> list_tree(const fs::path& root) {
    std::set<std::string> paths;
    if (!fs::exists(root)) {
        return paths;
    }
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        paths.insert(entry.path().lexically_relative(root).generic_string());
    }
    return paths;
}

} // namespace

class MergeEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
        target_ = root_ / "target";
        to_merge_ = root_ / "to_merge";
        fs::create_directories(target_);
        fs::create_directories(to_merge_);
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    fs::path root_;
    fs::path target_;
    fs::path to_merge_;
};

TEST(MergeValidationTest, RejectsSamePath) {
    auto result = merge_folders("fake/dir", "fake/dir");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message, "same path");

    auto trailing = merge_folders("fake/dir", "fake/./dir/");
    ASSERT_TRUE(trailing.is_error());
    EXPECT_EQ(trailing.error().message, "same path");
}

TEST(MergeValidationTest, RejectsNestedPaths) {
    for (const auto& [target, to_merge] : std::vector<std::pair<fs::path, fs::path>>{
             {"fake/dir", "fake/dir/sub"},
             {"fake/dir/sub", "fake/dir"},
             {"fake/dir/sub1/sub2", "fake/dir"}}) {
        auto result = merge_folders(target, to_merge);
        ASSERT_TRUE(result.is_error()) << target << " " << to_merge;
        EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
        EXPECT_EQ(result.error().message, "nested paths");
    }
}

TEST(MergeValidationTest, AncestorCheckIsComponentWise) {
    EXPECT_TRUE(is_ancestor("/a/b", "/a/b/c"));
    EXPECT_TRUE(is_ancestor("/a/b/", "/a/b/c"));
    EXPECT_TRUE(is_ancestor("/", "/a"));
    EXPECT_FALSE(is_ancestor("/a/b", "/a/bc"));
    EXPECT_FALSE(is_ancestor("/a/bc", "/a/b"));
    EXPECT_FALSE(is_ancestor("/a/b", "/a/b"));
    EXPECT_FALSE(is_ancestor("/a/b/c", "/a/b"));

    auto siblings = validate_roots("/data/b", "/data/bc");
    ASSERT_TRUE(siblings.is_ok());
    EXPECT_EQ(siblings.value().target, fs::path("/data/b"));
    EXPECT_EQ(siblings.value().to_merge, fs::path("/data/bc"));
}

TEST_F(MergeEngineTest, MissingRootIsNotFound) {
    auto result = merge_folders(target_, root_ / "absent");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
    EXPECT_TRUE(fs::exists(target_));
}

TEST_F(MergeEngineTest, MovesNetNewFile) {
    write_file(to_merge_ / "notes" / "new.txt", "fresh content");
    fs::create_directories(target_ / "notes");

    auto result = merge_folders(target_, to_merge_);

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
    EXPECT_EQ(read_file(target_ / "notes" / "new.txt"), "fresh content");
    EXPECT_FALSE(fs::exists(to_merge_));
}

TEST_F(MergeEngineTest, MovesWholeSubtreeWithoutVisitingDescendants) {
    write_file(to_merge_ / "photos" / "b.jpg", "to-merge b");
    write_file(to_merge_ / "photos" / "2024" / "a.jpg", "to-merge a");
    write_file(to_merge_ / "photosets" / "c.jpg", "sibling sharing a prefix");
    // Same file names elsewhere in target with different content
    write_file(target_ / "b.jpg", "target b");
    write_file(target_ / "2024" / "a.jpg", "target a");

    fm::events::EventBus bus;
    std::vector<std::string> moved;
    bus.subscribe<fm::events::EntryRelocatedEvent>([&](const fm::events::EntryRelocatedEvent& e) {
        moved.push_back(e.relative_path);
    });

    MergeEngine engine(MergeOptions{}, &bus);
    auto result = engine.merge(target_, to_merge_);

    ASSERT_TRUE(result.is_ok());
    const auto& report = result.value();
    EXPECT_TRUE(report.conflicts.empty());
    EXPECT_EQ(report.relocated, 2u);
    std::sort(moved.begin(), moved.end());
    EXPECT_EQ(moved, (std::vector<std::string>{"photos", "photosets"}));

    EXPECT_EQ(read_file(target_ / "photos" / "b.jpg"), "to-merge b");
    EXPECT_EQ(read_file(target_ / "photos" / "2024" / "a.jpg"), "to-merge a");
    EXPECT_EQ(read_file(target_ / "photosets" / "c.jpg"), "sibling sharing a prefix");
    EXPECT_EQ(read_file(target_ / "b.jpg"), "target b");
    EXPECT_EQ(read_file(target_ / "2024" / "a.jpg"), "target a");
    EXPECT_TRUE(report.to_merge_root_removed);
    EXPECT_FALSE(fs::exists(to_merge_));
}

TEST_F(MergeEngineTest, RemovesIdenticalDuplicate) {
    write_file(target_ / "dup.txt", "identical");
    write_file(to_merge_ / "dup.txt", "identical");

    MergeEngine engine;
    auto result = engine.merge(target_, to_merge_);

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().conflicts.empty());
    EXPECT_EQ(result.value().deduplicated, 1u);
    EXPECT_EQ(read_file(target_ / "dup.txt"), "identical");
    EXPECT_FALSE(fs::exists(to_merge_));
}

TEST_F(MergeEngineTest, ReportsDifferingFileAndLeavesBothInPlace) {
    write_file(target_ / "docs" / "plan.md", "target plan");
    write_file(to_merge_ / "docs" / "plan.md", "target plan" + kConflictPostfix);

    auto result = merge_folders(target_, to_merge_);

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);
    const auto& conflict = result.value().front();
    EXPECT_EQ(conflict.relative_path(), "docs/plan.md");
    EXPECT_FALSE(conflict.kind_mismatch());
    EXPECT_EQ(conflict.target.kind, EntryKind::File);
    EXPECT_EQ(conflict.target.path, fs::canonical(target_) / "docs" / "plan.md");
    EXPECT_EQ(read_file(target_ / "docs" / "plan.md"), "target plan");
    EXPECT_EQ(read_file(to_merge_ / "docs" / "plan.md"), "target plan" + kConflictPostfix);
}

TEST_F(MergeEngineTest, KindMismatchIsConflictAndNothingMoves) {
    // File in target, directory in to-merge
    write_file(target_ / "build", "a file");
    write_file(to_merge_ / "build" / "output.o", "object");
    // Directory in target, file in to-merge
    write_file(target_ / "cache" / "entry", "cached");
    write_file(to_merge_ / "cache", "a file");

    auto result = merge_folders(target_, to_merge_);

    ASSERT_TRUE(result.is_ok());
    const auto& conflicts = result.value();
    ASSERT_EQ(conflicts.size(), 2u);
    for (const auto& conflict : conflicts) {
        EXPECT_TRUE(conflict.kind_mismatch()) << conflict.relative_path();
    }
    auto paths = conflict_paths(conflicts);
    std::sort(paths.begin(), paths.end());
    EXPECT_EQ(paths, (std::vector<std::string>{"build", "cache"}));

    EXPECT_EQ(read_file(target_ / "build"), "a file");
    EXPECT_EQ(read_file(to_merge_ / "build" / "output.o"), "object");
    EXPECT_EQ(read_file(target_ / "cache" / "entry"), "cached");
    EXPECT_EQ(read_file(to_merge_ / "cache"), "a file");
}

TEST_F(MergeEngineTest, PrunesEverythingButTheConflictChain) {
    write_file(target_ / "keep" / "deep" / "c.txt", "target");
    write_file(to_merge_ / "keep" / "deep" / "c.txt", "different");
    write_file(target_ / "keep" / "same.txt", "same");
    write_file(to_merge_ / "keep" / "same.txt", "same");
    write_file(target_ / "shared" / "inner" / "d.txt", "d");
    write_file(to_merge_ / "shared" / "inner" / "d.txt", "d");
    fs::create_directories(target_ / "keep" / "hollow");
    fs::create_directories(to_merge_ / "keep" / "hollow");

    MergeEngine engine;
    auto result = engine.merge(target_, to_merge_);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(conflict_paths(result.value().conflicts), (std::vector<std::string>{"keep/deep/c.txt"}));
    EXPECT_FALSE(result.value().to_merge_root_removed);
    EXPECT_EQ(list_tree(to_merge_), (std::set<std::string>{"keep", "keep/deep", "keep/deep/c.txt"}));
    EXPECT_EQ(result.value().pruned_directories, 3u);
    EXPECT_TRUE(fs::exists(target_ / "keep" / "hollow"));
}

TEST_F(MergeEngineTest, ZeroReadBufferIsRejectedBeforeAnythingMoves) {
    write_file(to_merge_ / "a_new.txt", "only in to-merge");
    write_file(target_ / "z_dup.txt", "both");
    write_file(to_merge_ / "z_dup.txt", "both");

    MergeOptions options;
    options.read_buffer_size = 0;
    auto result = merge_folders(target_, to_merge_, options);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(list_tree(target_), (std::set<std::string>{"z_dup.txt"}));
    EXPECT_EQ(list_tree(to_merge_), (std::set<std::string>{"a_new.txt", "z_dup.txt"}));
}

TEST_F(MergeEngineTest, UnreadableFileAbortsWithIOError) {
    // Dangling links are walked as files and cannot be opened for hashing
    fs::create_symlink(root_ / "nowhere", target_ / "link");
    fs::create_symlink(root_ / "nowhere", to_merge_ / "link");

    auto result = merge_folders(target_, to_merge_);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::IOError);
    EXPECT_TRUE(fs::is_symlink(fs::symlink_status(target_ / "link")));
    EXPECT_TRUE(fs::is_symlink(fs::symlink_status(to_merge_ / "link")));
}

TEST_F(MergeEngineTest, EmptyToMergeRootIsRemoved) {
    auto result = merge_folders(target_, to_merge_);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
    EXPECT_FALSE(fs::exists(to_merge_));
    EXPECT_TRUE(fs::exists(target_));
}

class FullMergeTest : public MergeEngineTest {
protected:
    struct Node {
        std::string path;
        bool directory = false;
        bool in_target = true;
        bool in_to_merge = true;
        bool conflict = false; ///< File content differs in to-merge
    };

    // Mirrors a realistic mix: shared, target-only, to-merge-only and conflicting subtrees
    const std::vector<Node> layout_ {
        {"0", false},
        {"1", false, true, true, true},
        {"2", true},
        {"2/0", false},
        {"2/1", false},
        {"2/2", true},
        {"2/2/0", false},
        {"2/2/1", false},
        {"3", true, true, false},
        {"3/0", false, true, false},
        {"3/1", false, true, false, true},
        {"3/2", true, true, false},
        {"3/2/0", false, true, false, true},
        {"3/2/1", false, true, false},
        {"4", true, false, true},
        {"4/0", false, false, true},
        {"4/1", false, false, true, true},
        {"4/2", true, false, true},
        {"4/2/0", false, false, true, true},
        {"4/2/1", false, false, true},
        {"5", true},
        {"5/0", false},
        {"5/1", false, true, true, true},
        {"5/2", true},
        {"5/2/0", false, true, true, true},
        {"5/2/1", false},
    };

    void build(const fs::path& root, bool is_target) {
        for (const auto& node : layout_) {
            if (is_target ? !node.in_target : !node.in_to_merge) {
                continue;
            }
            if (node.directory) {
                fs::create_directories(root / node.path);
                continue;
            }
            std::string content = node.path;
            if (node.conflict && !is_target) {
                content += kConflictPostfix;
            }
            write_file(root / node.path, content);
        }
    }

    void SetUp() override {
        MergeEngineTest::SetUp();
        build(target_, true);
        build(to_merge_, false);
    }
};

TEST_F(FullMergeTest, MergesMixedTree) {
    auto result = merge_folders(target_, to_merge_);
    ASSERT_TRUE(result.is_ok());

    auto reported = conflict_paths(result.value());
    std::sort(reported.begin(), reported.end());
    EXPECT_EQ(reported, (std::vector<std::string>{"1", "5/1", "5/2/0"}));

    for (const auto& node : layout_) {
        const auto target_path = target_ / node.path;
        ASSERT_TRUE(fs::exists(target_path)) << node.path;
        if (node.directory) {
            EXPECT_TRUE(fs::is_directory(target_path)) << node.path;
            continue;
        }
        std::string expected = node.path;
        if (!node.in_target && node.conflict) {
            expected += kConflictPostfix;
        }
        EXPECT_EQ(read_file(target_path), expected) << node.path;
    }

    EXPECT_EQ(list_tree(to_merge_), (std::set<std::string>{"1", "5", "5/1", "5/2", "5/2/0"}));
}

TEST_F(FullMergeTest, RerunReportsSameConflictsAndChangesNothing) {
    auto first = merge_folders(target_, to_merge_);
    ASSERT_TRUE(first.is_ok());
    const auto target_before = list_tree(target_);
    const auto to_merge_before = list_tree(to_merge_);

    auto second = merge_folders(target_, to_merge_);
    ASSERT_TRUE(second.is_ok());

    auto first_paths = conflict_paths(first.value());
    auto second_paths = conflict_paths(second.value());
    std::sort(first_paths.begin(), first_paths.end());
    std::sort(second_paths.begin(), second_paths.end());
    EXPECT_EQ(first_paths, second_paths);
    EXPECT_EQ(list_tree(target_), target_before);
    EXPECT_EQ(list_tree(to_merge_), to_merge_before);
    EXPECT_EQ(read_file(to_merge_ / "5" / "1"), "5/1" + kConflictPostfix);
}

TEST_F(FullMergeTest, SequentialOptionsGiveSameResult) {
    MergeOptions options;
    options.worker_threads = 0;
    options.concurrent_walks = false;
    options.concurrent_digests = false;
    options.read_buffer_size = 3;

    auto result = merge_folders(target_, to_merge_, options);
    ASSERT_TRUE(result.is_ok());

    auto reported = conflict_paths(result.value());
    std::sort(reported.begin(), reported.end());
    EXPECT_EQ(reported, (std::vector<std::string>{"1", "5/1", "5/2/0"}));
    EXPECT_EQ(list_tree(to_merge_), (std::set<std::string>{"1", "5", "5/1", "5/2", "5/2/0"}));
}

TEST_F(FullMergeTest, AsyncEntryPoint) {
    auto future = merge_folders_async(target_, to_merge_);
    auto result = future.get();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().size(), 3u);
    EXPECT_TRUE(fs::exists(target_ / "4" / "2" / "1"));
}

TEST_F(FullMergeTest, EmitsLifecycleEvents) {
    fm::events::EventBus bus;
    fm::events::MetricsComponent metrics(bus);

    std::vector<std::string> conflicts_seen;
    bool started = false;
    bool completed = false;
    bus.subscribe<fm::events::MergeStartedEvent>([&](const fm::events::MergeStartedEvent& e) {
        started = true;
        EXPECT_EQ(e.target_root, fs::canonical(target_));
    });
    bus.subscribe<fm::events::MergeConflictDetectedEvent>([&](const fm::events::MergeConflictDetectedEvent& e) {
        EXPECT_FALSE(completed);
        conflicts_seen.push_back(e.conflict.relative_path());
    });
    bus.subscribe<fm::events::MergeCompletedEvent>([&](const fm::events::MergeCompletedEvent& e) {
        completed = true;
        EXPECT_EQ(e.conflicts, 3u);
    });

    MergeEngine engine(MergeOptions{}, &bus);
    auto result = engine.merge(target_, to_merge_);
    ASSERT_TRUE(result.is_ok());

    EXPECT_TRUE(started);
    EXPECT_TRUE(completed);
    // Events follow the order of the returned conflicts
    EXPECT_EQ(conflicts_seen, conflict_paths(result.value().conflicts));

    const auto& stats = metrics.get_stats();
    // 0, 2/0, 2/1, 2/2/0, 2/2/1, 5/0, 5/2/1
    EXPECT_EQ(stats.duplicates_removed.load(), 7u);
    // Directory 4 moves as one entry
    EXPECT_EQ(stats.entries_relocated.load(), 1u);
    EXPECT_EQ(stats.directories_relocated.load(), 1u);
    EXPECT_EQ(stats.conflicts_detected.load(), 3u);
    // 2/2 and 2 are emptied by deduplication
    EXPECT_EQ(stats.directories_pruned.load(), 2u);
    EXPECT_EQ(stats.merges_completed.load(), 1u);
    EXPECT_EQ(stats.merges_failed.load(), 0u);
}

TEST_F(MergeEngineTest, FailedRunEmitsFailureEvent) {
    fm::events::EventBus bus;
    fm::events::MetricsComponent metrics(bus);

    MergeEngine engine(MergeOptions{}, &bus);
    auto result = engine.merge(target_, target_);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(metrics.get_stats().merges_failed.load(), 1u);
    EXPECT_EQ(metrics.get_stats().merges_completed.load(), 0u);
}
