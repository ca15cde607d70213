#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "treewatch/common/status.h"
#include "treewatch/manager/file_watch_manager.h"
#include "treewatch/manager/lambda_file_watch_manager.h"
#include "treewatch/manager/logged_file_watch_manager.h"
#include "treewatch/manager/simple_file_watch_manager.h"
#include "treewatch/watch/in_memory_watch_service.h"
#include "treewatch/watch/inotify_watch_service.h"

#include "test_helpers.h"

namespace treewatch {
namespace {

namespace fs = std::filesystem;

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Not;
using ::testing::UnorderedElementsAre;

// Remembers every callback and fails the ones it is told to.
class RecordingManager : public FileWatchManager {
public:
    RecordingManager(std::shared_ptr<IWatchService> service, const WatchManagerConfig& config)
        : FileWatchManager(std::move(service), config) {}

    ~RecordingManager() override {
        Release();
        absl::Status status = Close();
        EXPECT_TRUE(status.ok()) << status;
    }

    void FailOn(const std::string& action, const fs::path& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_.insert(action + " " + path.string());
    }

    std::vector<std::string> Calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    void ClearCalls() {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.clear();
    }

    int CountOf(const std::string& call) {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(std::count(calls_.begin(), calls_.end(), call));
    }

    std::vector<std::pair<fs::path, absl::Status>> Errors() {
        std::lock_guard<std::mutex> lock(mutex_);
        return errors_;
    }

    // The next matching callback parks until Release().
    void BlockOn(const std::string& action, const fs::path& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        blocked_call_ = action + " " + path.string();
        gate_ = std::promise<void>();
        gate_open_ = gate_.get_future().share();
        released_ = false;
    }

    bool WaitUntilBlocked() {
        return test::WaitFor([this]() { return blocked_.load(); });
    }

    void Release() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!released_) {
            released_ = true;
            gate_.set_value();
        }
    }

    void SetCallbackDelay(std::chrono::milliseconds delay) { delay_ms_ = static_cast<int>(delay.count()); }

    // Highest number of callbacks that were running at the same time.
    int MaxConcurrentCallbacks() const { return max_running_; }

protected:
    absl::Status OnAddFile(const fs::path& path) override { return Record("add_file", path); }
    absl::Status OnAddDirectory(const fs::path& path) override { return Record("add_dir", path); }
    absl::Status OnChangeFile(const fs::path& path) override { return Record("change_file", path); }
    absl::Status OnChangeDirectory(const fs::path& path) override { return Record("change_dir", path); }
    absl::Status OnRemoveFile(const fs::path& path) override { return Record("remove_file", path); }
    absl::Status OnRemoveDirectory(const fs::path& path) override { return Record("remove_dir", path); }

    void HandleException(const fs::path& path, const absl::Status& status) override {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_.emplace_back(path, status);
    }

private:
    absl::Status Record(const std::string& action, const fs::path& path) {
        const std::string call = action + " " + path.string();
        const int running = ++running_;
        int seen = max_running_;
        while (running > seen && !max_running_.compare_exchange_weak(seen, running)) {
        }

        std::shared_future<void> gate;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (call == blocked_call_) {
                blocked_call_.clear();
                gate = gate_open_;
            }
        }
        if (gate.valid()) {
            blocked_ = true;
            gate.wait();
        }
        if (delay_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_.load()));
        }

        absl::Status status = absl::OkStatus();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failures_.count(call) != 0) {
                status = absl::AbortedError("injected failure");
            } else {
                calls_.push_back(call);
            }
        }
        --running_;
        return status;
    }

    std::mutex mutex_;
    std::string blocked_call_;
    std::promise<void> gate_;
    std::shared_future<void> gate_open_;
    bool released_ = true;
    std::atomic<bool> blocked_{false};
    std::atomic<int> delay_ms_{0};
    std::atomic<int> running_{0};
    std::atomic<int> max_running_{0};
    std::set<std::string> failures_;
    std::vector<std::string> calls_;
    std::vector<std::pair<fs::path, absl::Status>> errors_;
};

std::string Call(const std::string& action, const fs::path& path) {
    return action + " " + path.string();
}

class FileWatchManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = temp_dir_.path() / "root";
        fs::create_directories(root_ / "d" / "e");
        test::WriteFile(root_ / "a.txt");
        test::WriteFile(root_ / "d" / "b.txt");
        test::WriteFile(root_ / "d" / "e" / "c.txt");

        config_.SetMaxThreads(2);
        config_.SetPollTimeout(std::chrono::milliseconds(20));
        service_ = std::make_shared<InMemoryWatchService>();
        manager_ = std::make_unique<RecordingManager>(service_, config_);
    }

    PathSet Paths() {
        auto paths = manager_->GetPaths();
        EXPECT_TRUE(paths.ok()) << paths.status();
        return paths.ok() ? **paths : PathSet{};
    }

    PathSet FullTree() const {
        return PathSet{root_, root_ / "a.txt", root_ / "d", root_ / "d" / "b.txt",
                       root_ / "d" / "e", root_ / "d" / "e" / "c.txt"};
    }

    test::TempDir temp_dir_;
    fs::path root_;
    WatchManagerConfig config_;
    std::shared_ptr<InMemoryWatchService> service_;
    std::unique_ptr<RecordingManager> manager_;
};

// ============================================================================
// Add / Remove
// ============================================================================

TEST_F(FileWatchManagerTest, AddWatchesTheWholeTree) {
    ASSERT_TRUE(manager_->Add(root_).ok());

    EXPECT_EQ(Paths(), FullTree());
    EXPECT_EQ(service_->ActiveHandleCount(), 3u);
    EXPECT_THAT(service_->WatchedDirectories(),
                UnorderedElementsAre(root_, root_ / "d", root_ / "d" / "e"));
    EXPECT_EQ(manager_->CountOf(Call("add_file", root_ / "d" / "e" / "c.txt")), 1);
}

TEST_F(FileWatchManagerTest, AddNormalizesThePath) {
    ASSERT_TRUE(manager_->Add(root_ / "d" / ".." / "").ok());
    EXPECT_EQ(Paths(), FullTree());
}

TEST_F(FileWatchManagerTest, AddTwiceIsANoOp) {
    ASSERT_TRUE(manager_->Add(root_).ok());
    manager_->ClearCalls();

    ASSERT_TRUE(manager_->Add(root_).ok());
    ASSERT_TRUE(manager_->Add(root_ / "d").ok());
    EXPECT_THAT(manager_->Calls(), IsEmpty());
    EXPECT_EQ(service_->RegistrationCount(), 3u);
}

TEST_F(FileWatchManagerTest, AddRejectsNonDirectories) {
    EXPECT_TRUE(IsNotDirectory(manager_->Add(root_ / "a.txt")));
    EXPECT_TRUE(IsNotDirectory(manager_->Add(root_ / "missing")));
    EXPECT_THAT(Paths(), IsEmpty());
}

TEST_F(FileWatchManagerTest, FailedAddLeavesNoTrace) {
    manager_->FailOn("add_file", root_ / "d" / "e" / "c.txt");

    absl::Status status = manager_->Add(root_);
    EXPECT_TRUE(absl::IsAborted(status)) << status;
    EXPECT_THAT(Paths(), IsEmpty());
    EXPECT_EQ(service_->ActiveHandleCount(), 0u);

    // Every completed addition was undone.
    for (const fs::path& path : {root_ / "a.txt", root_ / "d" / "b.txt"}) {
        EXPECT_EQ(manager_->CountOf(Call("remove_file", path)), 1);
    }
    for (const fs::path& path : {root_, root_ / "d", root_ / "d" / "e"}) {
        EXPECT_EQ(manager_->CountOf(Call("remove_dir", path)), 1);
    }
}

TEST_F(FileWatchManagerTest, RemoveUnwatchesTheWholeTree) {
    ASSERT_TRUE(manager_->Add(root_).ok());
    manager_->ClearCalls();

    ASSERT_TRUE(manager_->Remove(root_).ok());
    EXPECT_THAT(Paths(), IsEmpty());
    EXPECT_EQ(service_->ActiveHandleCount(), 0u);
    EXPECT_THAT(manager_->Calls(), ElementsAre(Call("remove_file", root_ / "a.txt"),
                                               Call("remove_file", root_ / "d" / "b.txt"),
                                               Call("remove_file", root_ / "d" / "e" / "c.txt"),
                                               Call("remove_dir", root_ / "d" / "e"),
                                               Call("remove_dir", root_ / "d"),
                                               Call("remove_dir", root_)));
}

TEST_F(FileWatchManagerTest, RemoveOfSubtreeKeepsTheRest) {
    ASSERT_TRUE(manager_->Add(root_).ok());
    ASSERT_TRUE(manager_->Remove(root_ / "d").ok());

    EXPECT_EQ(Paths(), (PathSet{root_, root_ / "a.txt"}));
    EXPECT_EQ(service_->ActiveHandleCount(), 1u);
}

TEST_F(FileWatchManagerTest, RemoveOfUnwatchedDirectoryIsANoOp) {
    EXPECT_TRUE(manager_->Remove(root_).ok());
    EXPECT_THAT(manager_->Calls(), IsEmpty());
    EXPECT_TRUE(IsNotDirectory(manager_->Remove(root_ / "a.txt")));
}

TEST_F(FileWatchManagerTest, RemoveAfterDirectoryVanished) {
    ASSERT_TRUE(manager_->Add(root_).ok());
    fs::remove_all(root_);

    ASSERT_TRUE(manager_->Remove(root_).ok());
    EXPECT_THAT(Paths(), IsEmpty());
    EXPECT_EQ(service_->ActiveHandleCount(), 0u);
}

TEST_F(FileWatchManagerTest, ConcurrentOverlappingAddsRegisterOnce) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([this, i]() {
            const fs::path target = (i % 2 == 0) ? root_ : root_ / "d";
            EXPECT_TRUE(manager_->Add(target).ok());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(Paths(), FullTree());
    for (const fs::path& path : FullTree()) {
        const int adds = manager_->CountOf(Call("add_file", path)) + manager_->CountOf(Call("add_dir", path));
        EXPECT_EQ(adds, 1) << path;
    }
    EXPECT_EQ(service_->RegistrationCount(), 3u);
}

TEST_F(FileWatchManagerTest, HiddenRootIsWatchedWhenNamed) {
    fs::create_directories(root_ / ".cache" / ".tmp");
    test::WriteFile(root_ / ".cache" / "f.txt");

    ASSERT_TRUE(manager_->Add(root_ / ".cache").ok());
    EXPECT_EQ(Paths(), (PathSet{root_ / ".cache", root_ / ".cache" / "f.txt"}));
}

TEST_F(FileWatchManagerTest, RemoveAndNestedAddNeverInterleave) {
    const fs::path cache = root_ / "d" / ".cache";
    fs::create_directories(cache);
    test::WriteFile(cache / "f.txt");
    test::WriteFile(cache / "g.txt");
    ASSERT_TRUE(manager_->Add(root_).ok());
    ASSERT_THAT(Paths(), Not(Contains(cache)));
    manager_->SetCallbackDelay(std::chrono::milliseconds(20));

    std::thread remover([this]() { EXPECT_TRUE(manager_->Remove(root_ / "d").ok()); });
    std::thread adder([this, &cache]() { EXPECT_TRUE(manager_->Add(cache).ok()); });
    remover.join();
    adder.join();

    EXPECT_EQ(manager_->MaxConcurrentCallbacks(), 1);
    const PathSet paths = Paths();
    EXPECT_EQ(paths.count(root_ / "d"), 0u);
    EXPECT_EQ(paths.count(root_ / "d" / "b.txt"), 0u);
    // Whichever ran second saw the other's complete result.
    EXPECT_EQ(paths.count(cache), paths.count(cache / "f.txt"));
    EXPECT_EQ(paths.count(cache), paths.count(cache / "g.txt"));
}

TEST_F(FileWatchManagerTest, DisjointAddsRunInParallel) {
    const fs::path x = temp_dir_.path() / "x";
    const fs::path y = temp_dir_.path() / "y";
    for (const fs::path& dir : {x, y}) {
        fs::create_directories(dir / "sub");
        test::WriteFile(dir / "one.txt");
        test::WriteFile(dir / "sub" / "two.txt");
    }
    manager_->SetCallbackDelay(std::chrono::milliseconds(100));

    std::thread add_x([this, &x]() { EXPECT_TRUE(manager_->Add(x).ok()); });
    std::thread add_y([this, &y]() { EXPECT_TRUE(manager_->Add(y).ok()); });
    add_x.join();
    add_y.join();

    EXPECT_GE(manager_->MaxConcurrentCallbacks(), 2);
    EXPECT_EQ(Paths().size(), 8u);
}

// ============================================================================
// Close
// ============================================================================

TEST_F(FileWatchManagerTest, ClosedManagerRejectsEverything) {
    ASSERT_TRUE(manager_->Add(root_).ok());

    EXPECT_TRUE(manager_->Close().ok());
    EXPECT_TRUE(manager_->IsClosed());
    EXPECT_TRUE(service_->IsClosed());
    EXPECT_EQ(service_->ActiveHandleCount(), 0u);

    EXPECT_TRUE(IsManagerClosed(manager_->Add(root_)));
    EXPECT_TRUE(IsManagerClosed(manager_->Remove(root_)));
    EXPECT_TRUE(IsManagerClosed(manager_->GetPaths().status()));
    EXPECT_TRUE(manager_->Close().ok());
}

// ============================================================================
// Events
// ============================================================================

TEST_F(FileWatchManagerTest, CreatedFileIsAddedOnce) {
    ASSERT_TRUE(manager_->Add(root_).ok());
    test::WriteFile(root_ / "new.txt");

    ASSERT_TRUE(service_->Signal(root_, {{ChangeKind::kCreated, "new.txt"},
                                         {ChangeKind::kCreated, "new.txt"}}).ok());

    ASSERT_TRUE(test::WaitFor([this]() { return Paths().count(root_ / "new.txt") == 1; }));
    ASSERT_TRUE(test::WaitFor([this]() { return manager_->PendingEvents() == 0; }));
    EXPECT_EQ(manager_->CountOf(Call("add_file", root_ / "new.txt")), 1);
}

TEST_F(FileWatchManagerTest, CreatedDirectoryIsWalked) {
    ASSERT_TRUE(manager_->Add(root_).ok());
    fs::create_directories(root_ / "n" / "m");
    test::WriteFile(root_ / "n" / "m" / "x.txt");

    ASSERT_TRUE(service_->Signal(root_, {{ChangeKind::kCreated, "n"}}).ok());

    ASSERT_TRUE(test::WaitFor([this]() { return Paths().count(root_ / "n" / "m" / "x.txt") == 1; }));
    EXPECT_TRUE(manager_->CountOf(Call("add_dir", root_ / "n")) == 1);
    EXPECT_THAT(service_->WatchedDirectories(), Contains(root_ / "n" / "m"));
}

TEST_F(FileWatchManagerTest, CreatedHiddenEntryIsIgnored) {
    ASSERT_TRUE(manager_->Add(root_).ok());
    test::WriteFile(root_ / ".swp");
    test::WriteFile(root_ / "seen.txt");

    ASSERT_TRUE(service_->Signal(root_, {{ChangeKind::kCreated, ".swp"},
                                         {ChangeKind::kCreated, "seen.txt"}}).ok());

    ASSERT_TRUE(test::WaitFor([this]() { return Paths().count(root_ / "seen.txt") == 1; }));
    EXPECT_THAT(Paths(), Not(Contains(root_ / ".swp")));
}

TEST_F(FileWatchManagerTest, ModifiedPathsReportChanges) {
    ASSERT_TRUE(manager_->Add(root_).ok());

    ASSERT_TRUE(service_->Signal(root_, {{ChangeKind::kModified, "a.txt"},
                                         {ChangeKind::kModified, "d"},
                                         {ChangeKind::kModified, "unknown.txt"}}).ok());

    ASSERT_TRUE(test::WaitFor([this]() {
        return manager_->CountOf(Call("change_file", root_ / "a.txt")) == 1 &&
               manager_->CountOf(Call("change_dir", root_ / "d")) == 1;
    }));
    ASSERT_TRUE(test::WaitFor([this]() { return manager_->PendingEvents() == 0; }));
    EXPECT_EQ(manager_->CountOf(Call("change_file", root_ / "unknown.txt")), 0);
}

TEST_F(FileWatchManagerTest, DeletedDirectoryIsRemovedWithItsContents) {
    ASSERT_TRUE(manager_->Add(root_).ok());
    fs::remove_all(root_ / "d");

    ASSERT_TRUE(service_->Signal(root_, {{ChangeKind::kDeleted, "d"}}).ok());

    ASSERT_TRUE(test::WaitFor([this]() { return Paths() == PathSet{root_, root_ / "a.txt"}; }));
    EXPECT_EQ(service_->ActiveHandleCount(), 1u);
    EXPECT_EQ(manager_->CountOf(Call("remove_file", root_ / "d" / "e" / "c.txt")), 1);
    EXPECT_EQ(manager_->CountOf(Call("remove_dir", root_ / "d")), 1);
}

TEST_F(FileWatchManagerTest, ReplacedFileIsWatchedAgain) {
    ASSERT_TRUE(manager_->Add(root_).ok());
    manager_->ClearCalls();

    // The file is back on disk by the time the delete is processed.
    ASSERT_TRUE(service_->Signal(root_, {{ChangeKind::kDeleted, "a.txt"}}).ok());

    ASSERT_TRUE(test::WaitFor([this]() { return manager_->Calls().size() == 2; }));
    EXPECT_THAT(manager_->Calls(), ElementsAre(Call("remove_file", root_ / "a.txt"),
                                               Call("add_file", root_ / "a.txt")));
    EXPECT_EQ(Paths(), FullTree());
}

TEST_F(FileWatchManagerTest, EventFailuresReachHandleException) {
    ASSERT_TRUE(manager_->Add(root_).ok());
    test::WriteFile(root_ / "bad.txt");
    manager_->FailOn("add_file", root_ / "bad.txt");

    ASSERT_TRUE(service_->Signal(root_, {{ChangeKind::kCreated, "bad.txt"}}).ok());

    ASSERT_TRUE(test::WaitFor([this]() { return manager_->Errors().size() == 1; }));
    auto errors = manager_->Errors();
    EXPECT_EQ(errors[0].first, root_ / "bad.txt");
    EXPECT_TRUE(absl::IsAborted(errors[0].second));
    EXPECT_THAT(Paths(), Not(Contains(root_ / "bad.txt")));
}

TEST_F(FileWatchManagerTest, CreateQueuedBehindRemoveLeavesNothing) {
    ASSERT_TRUE(manager_->Add(root_).ok());
    manager_->BlockOn("change_file", root_ / "a.txt");
    ASSERT_TRUE(service_->Signal(root_, {{ChangeKind::kModified, "a.txt"}}).ok());
    ASSERT_TRUE(manager_->WaitUntilBlocked());

    // Waits for the modification's claim on the root's subtree.
    std::thread remover([this]() { EXPECT_TRUE(manager_->Remove(root_).ok()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    test::WriteFile(root_ / "new.txt");
    fs::create_directories(root_ / "n");
    ASSERT_TRUE(service_->Signal(root_, {{ChangeKind::kCreated, "new.txt"},
                                         {ChangeKind::kCreated, "n"}}).ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    manager_->Release();
    remover.join();
    ASSERT_TRUE(test::WaitFor([this]() { return manager_->PendingEvents() == 0; }));

    EXPECT_THAT(Paths(), IsEmpty());
    EXPECT_EQ(service_->ActiveHandleCount(), 0u);
    EXPECT_EQ(manager_->CountOf(Call("add_file", root_ / "new.txt")),
              manager_->CountOf(Call("remove_file", root_ / "new.txt")));
    EXPECT_EQ(manager_->CountOf(Call("add_dir", root_ / "n")),
              manager_->CountOf(Call("remove_dir", root_ / "n")));
    EXPECT_TRUE(manager_->Remove(root_).ok());
}

TEST_F(FileWatchManagerTest, CreateUnderUnwatchedParentIsIgnored) {
    ASSERT_TRUE(manager_->Add(root_).ok());
    ASSERT_TRUE(manager_->Remove(root_ / "d").ok());
    manager_->ClearCalls();
    test::WriteFile(root_ / "d" / "late.txt");

    // A burst read before the removal, delivered after it.
    ASSERT_TRUE(service_->Signal(root_, {{ChangeKind::kCreated, "d/late.txt"},
                                         {ChangeKind::kDeleted, "a.txt"}}).ok());

    ASSERT_TRUE(test::WaitFor([this]() { return manager_->CountOf(Call("add_file", root_ / "a.txt")) == 1; }));
    ASSERT_TRUE(test::WaitFor([this]() { return manager_->PendingEvents() == 0; }));
    EXPECT_THAT(Paths(), Not(Contains(root_ / "d" / "late.txt")));
    EXPECT_EQ(manager_->CountOf(Call("add_file", root_ / "d" / "late.txt")), 0);
}

// ============================================================================
// Variants
// ============================================================================

TEST_F(FileWatchManagerTest, LambdaManagerRequiresEveryCallback) {
    auto ok = [](const fs::path&) { return absl::OkStatus(); };
    auto on_error = [](const fs::path&, const absl::Status&) {};

    auto missing = LambdaFileWatchManager::Create(service_, ok, nullptr, ok, on_error, config_);
    EXPECT_TRUE(absl::IsInvalidArgument(missing.status()));

    LambdaCallbacks callbacks;
    callbacks.on_add_file = ok;
    auto partial = LambdaFileWatchManager::Create(service_, callbacks, config_);
    EXPECT_TRUE(absl::IsInvalidArgument(partial.status()));

    auto no_service = LambdaFileWatchManager::Create(nullptr, ok, ok, ok, on_error, config_);
    EXPECT_TRUE(absl::IsInvalidArgument(no_service.status()));
}

TEST_F(FileWatchManagerTest, LambdaManagerForwardsCallbacks) {
    std::mutex mutex;
    std::vector<fs::path> added;
    auto on_add = [&](const fs::path& path) {
        std::lock_guard<std::mutex> lock(mutex);
        added.push_back(path);
        return absl::OkStatus();
    };
    auto ok = [](const fs::path&) { return absl::OkStatus(); };

    auto service = std::make_shared<InMemoryWatchService>();
    auto manager = LambdaFileWatchManager::Create(
        service, on_add, ok, ok, [](const fs::path&, const absl::Status&) {}, config_);
    ASSERT_TRUE(manager.ok()) << manager.status();

    ASSERT_TRUE((*manager)->Add(root_ / "d" / "e").ok());
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_THAT(added, ElementsAre(root_ / "d" / "e", root_ / "d" / "e" / "c.txt"));
}

TEST_F(FileWatchManagerTest, SimpleAndLoggedManagersTrackPaths) {
    {
        SimpleFileWatchManager simple(std::make_shared<InMemoryWatchService>(), config_);
        ASSERT_TRUE(simple.Add(root_).ok());
        auto paths = simple.GetPaths();
        ASSERT_TRUE(paths.ok());
        EXPECT_EQ(**paths, FullTree());
    }
    {
        LoggedFileWatchManager logged(std::make_shared<InMemoryWatchService>(), config_);
        ASSERT_TRUE(logged.Add(root_).ok());
        ASSERT_TRUE(logged.Remove(root_ / "d").ok());
        auto paths = logged.GetPaths();
        ASSERT_TRUE(paths.ok());
        EXPECT_EQ(**paths, (PathSet{root_, root_ / "a.txt"}));
        EXPECT_TRUE(logged.Close().ok());
    }
}

// ============================================================================
// Against the kernel
// ============================================================================

class InotifyFileWatchManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto service = InotifyWatchService::Create();
        if (!service.ok()) {
            GTEST_SKIP() << "inotify unavailable: " << service.status();
        }
        root_ = NormalizePath(temp_dir_.path());
        config_.SetMaxThreads(2);
        config_.SetPollTimeout(std::chrono::milliseconds(50));
        manager_ = std::make_unique<RecordingManager>(
            std::shared_ptr<IWatchService>(std::move(*service)), config_);
        ASSERT_TRUE(manager_->Add(root_).ok());
    }

    bool Watched(const fs::path& path) {
        auto paths = manager_->GetPaths();
        return paths.ok() && (*paths)->count(path) == 1;
    }

    test::TempDir temp_dir_;
    fs::path root_;
    WatchManagerConfig config_;
    std::unique_ptr<RecordingManager> manager_;
};

TEST_F(InotifyFileWatchManagerTest, NewFileIsReportedOnce) {
    test::WriteFile(root_ / "b.txt", "hello");

    ASSERT_TRUE(test::WaitFor([this]() { return Watched(root_ / "b.txt"); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(manager_->CountOf(Call("add_file", root_ / "b.txt")), 1);
}

TEST_F(InotifyFileWatchManagerTest, NewSubtreeAndItsRemoval) {
    fs::create_directories(root_ / "sub");
    test::WriteFile(root_ / "sub" / "inner.txt");

    ASSERT_TRUE(test::WaitFor([this]() { return Watched(root_ / "sub" / "inner.txt"); }));
    EXPECT_EQ(manager_->CountOf(Call("add_file", root_ / "sub" / "inner.txt")), 1);

    fs::remove_all(root_ / "sub");
    ASSERT_TRUE(test::WaitFor([this]() { return !Watched(root_ / "sub"); }));
    EXPECT_FALSE(Watched(root_ / "sub" / "inner.txt"));
    EXPECT_TRUE(Watched(root_));
}

}  // namespace
}  // namespace treewatch
