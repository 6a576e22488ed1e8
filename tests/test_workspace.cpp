#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>

#include "workspace/workspace.hpp"

using namespace termctl;

namespace fs = std::filesystem;

class WorkspaceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() / ("termctl_ws_" + std::to_string(std::random_device{}()));
    fs::create_directories(test_dir_);
    test_dir_ = fs::canonical(test_dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  void touch(const fs::path& path) {
    std::ofstream file(path);
    file << "x";
  }

  // Markers above the temp directory would make detection find them first
  bool ancestors_have_marker() const {
    for (auto dir = test_dir_.parent_path();; dir = dir.parent_path()) {
      if (workspace::find_marker(dir)) return true;
      if (dir == dir.parent_path()) return false;
    }
  }

  fs::path test_dir_;
};

TEST_F(WorkspaceTest, MarkerListIsOrdered) {
  const auto& markers = workspace::project_markers();
  ASSERT_FALSE(markers.empty());
  EXPECT_EQ(markers.front(), ".git");
  EXPECT_NE(std::find(markers.begin(), markers.end(), "CMakeLists.txt"), markers.end());
}

TEST_F(WorkspaceTest, MarkerThreeLevelsUp) {
  auto root = test_dir_ / "project";
  auto deep = root / "a" / "b" / "c";
  fs::create_directories(deep);
  fs::create_directories(root / ".git");

  EXPECT_EQ(workspace::resolve(deep), root);
}

TEST_F(WorkspaceTest, ClosestMarkerWins) {
  auto outer = test_dir_ / "outer";
  auto inner = outer / "packages" / "inner";
  fs::create_directories(inner / "src");
  fs::create_directories(outer / ".git");
  touch(inner / "package.json");

  EXPECT_EQ(workspace::resolve(inner / "src"), inner);
}

TEST_F(WorkspaceTest, FileStartUsesItsDirectory) {
  auto root = test_dir_ / "proj";
  fs::create_directories(root / "src");
  touch(root / "Cargo.toml");
  touch(root / "src" / "main.rs");

  EXPECT_EQ(workspace::resolve(root / "src" / "main.rs"), root);
}

TEST_F(WorkspaceTest, NoMarkerReturnsStart) {
  if (ancestors_have_marker()) {
    GTEST_SKIP() << "temp directory lives inside a project";
  }
  auto start = test_dir_ / "plain" / "dir";
  fs::create_directories(start);

  EXPECT_EQ(workspace::resolve(start), start);
}

TEST_F(WorkspaceTest, OverrideWinsWhenDirectory) {
  auto chosen = test_dir_ / "chosen";
  fs::create_directories(chosen);
  fs::create_directories(test_dir_ / "other" / ".git");

  EXPECT_EQ(workspace::resolve_root(chosen, test_dir_ / "other"), chosen);
}

TEST_F(WorkspaceTest, MissingOverrideFallsBackToDetection) {
  auto project = test_dir_ / "project";
  fs::create_directories(project / ".git");

  auto root = workspace::resolve_root(test_dir_ / "does-not-exist", project);
  EXPECT_EQ(root, project);
  EXPECT_TRUE(fs::is_directory(root));
}

TEST_F(WorkspaceTest, RootIsAlwaysADirectory) {
  auto root = workspace::resolve_root(std::nullopt, test_dir_ / "missing" / "start");
  EXPECT_TRUE(fs::is_directory(root));
}
