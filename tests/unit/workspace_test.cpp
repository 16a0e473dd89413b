#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "img2reel/workspace.hpp"
#include "test_support.hpp"

namespace {

using img2reel::Error;
using img2reel::TempFileGuard;
using img2reel::WorkspaceManager;
using img2reel_test::ScratchDir;
using img2reel_test::WriteFile;
namespace fs = std::filesystem;

void TestArtifactNaming() {
  assert(WorkspaceManager::artifact_filename("abc") == "reel-abc.mp4");
  assert(WorkspaceManager::is_artifact_name("reel-abc.mp4"));
  assert(WorkspaceManager::is_artifact_name("reel-abc.MP4"));
  assert(!WorkspaceManager::is_artifact_name("reel-.mp4"));
  assert(!WorkspaceManager::is_artifact_name("intro.mp4"));
  assert(!WorkspaceManager::is_artifact_name("reel-abc.mp4.part"));
  assert(!WorkspaceManager::is_artifact_name(".reel-abc.mp4.part"));
  assert(WorkspaceManager::is_partial_name(".reel-abc.mp4.part"));
  assert(!WorkspaceManager::is_partial_name("reel-abc.mp4.part"));
  assert(!WorkspaceManager::is_partial_name(".part"));
}

void TestEnsureDirectoriesIsIdempotent() {
  ScratchDir       root("ws-ensure");
  WorkspaceManager ws(root / "out/nested", root / "work");
  Error            err;

  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&ws] {
      Error local;
      assert(ws.ensure_output_directory(local));
    });
  }
  for (auto& t : threads) t.join();

  assert(ws.ensure_output_directory(err));
  assert(ws.ensure_work_directory(err));
  assert(fs::is_directory(root / "out/nested"));
  assert(fs::is_directory(root / "work"));

  // A regular file in the way is reported, not thrown.
  WriteFile(root / "blocked", "x");
  WorkspaceManager blocked(root / "blocked", root / "work");
  Error            blocked_err;
  assert(!blocked.ensure_output_directory(blocked_err));
  assert(blocked_err.kind == img2reel::ErrorKind::Internal);
}

void TestPurgeRemovesOnlyArtifacts() {
  ScratchDir       root("ws-purge");
  WorkspaceManager ws(root.path(), root / "work");

  WriteFile(root / "reel-1.mp4", "a");
  WriteFile(root / "reel-2.mp4", "b");
  WriteFile(root / "notes.txt", "keep");
  WriteFile(root / "other.mp4", "keep");
  fs::create_directories(root / "reel-dir.mp4");
  WriteFile(root / ".reel-3.mp4.part", "stale copy from an interrupted publish");
  WriteFile(root / ".notes.part", "keep");
  WriteFile(root / "reel-4.mp4.part", "keep");

  assert(ws.purge_artifacts() == 3);
  assert(!fs::exists(root / ".reel-3.mp4.part"));
  assert(fs::exists(root / ".notes.part"));
  assert(fs::exists(root / "reel-4.mp4.part"));
  assert(!fs::exists(root / "reel-1.mp4"));
  assert(!fs::exists(root / "reel-2.mp4"));
  assert(fs::exists(root / "notes.txt"));
  assert(fs::exists(root / "other.mp4"));
  assert(fs::exists(root / "reel-dir.mp4"));

  // Missing directory: logged, not fatal.
  WorkspaceManager missing(root / "does-not-exist", root / "work");
  assert(missing.purge_artifacts() == 0);
}

void TestTempPathsAreUniqueAndReleased() {
  ScratchDir       root("ws-temp");
  WorkspaceManager ws(root / "out", root.path());
  Error            err;

  std::string a;
  std::string b;
  assert(ws.make_temp_path("src", ".png", a, err));
  assert(ws.make_temp_path("src", ".png", b, err));
  assert(a != b);
  assert(fs::path(a).parent_path() == root.path());
  assert(fs::path(a).filename().string().rfind("img2reel-src-", 0) == 0);
  assert(fs::path(a).extension() == ".png");

  {
    WriteFile(a, "data");
    TempFileGuard guard(ws, a);
    assert(fs::exists(a));
  }
  assert(!fs::exists(a));

  // Releasing a missing file is silent.
  ws.release(b);
  ws.release("");
}

void TestPublishPurgesThenMoves() {
  ScratchDir       root("ws-publish");
  WorkspaceManager ws(root / "out", root / "work");
  Error            err;
  assert(ws.ensure_work_directory(err));

  fs::create_directories(root / "out");
  WriteFile(root / "out/reel-old.mp4", "old");
  WriteFile(root / "out/.reel-old.mp4.part", "half");

  std::string tmp;
  assert(ws.make_temp_path("out", ".mp4", tmp, err));
  WriteFile(tmp, "new artifact");

  std::string final_path;
  assert(ws.publish("[Req test0001]", tmp, "reel-new.mp4", final_path, err));
  assert(final_path == (root / "out/reel-new.mp4").string());
  assert(!fs::exists(tmp));
  assert(!fs::exists(root / "out/reel-old.mp4"));
  assert(img2reel_test::ReadFile(final_path) == "new artifact");
  assert(img2reel_test::CountEntries(root / "out") == 1);

  // Missing temp file fails cleanly.
  Error missing_err;
  assert(!ws.publish("[Req test0002]", (root / "work/nothing.mp4").string(), "reel-x.mp4", final_path, missing_err));
  assert(missing_err.kind == img2reel::ErrorKind::Internal);
}

void TestConcurrentPublishLeavesOneArtifact() {
  ScratchDir       root("ws-race");
  WorkspaceManager ws(root / "out", root / "work");
  Error            err;
  assert(ws.ensure_work_directory(err));

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&ws, i] {
      Error       local;
      std::string tmp;
      assert(ws.make_temp_path("out", ".mp4", tmp, local));
      WriteFile(tmp, std::to_string(i));
      std::string final_path;
      assert(ws.publish("[Req race]", tmp, WorkspaceManager::artifact_filename(std::to_string(i)), final_path, local));
    });
  }
  for (auto& t : threads) t.join();

  assert(img2reel_test::CountEntries(root / "out") == 1);
  assert(img2reel_test::CountEntries(root / "work") == 0);
}

}  // namespace

int main() {
  TestArtifactNaming();
  TestEnsureDirectoriesIsIdempotent();
  TestPurgeRemovesOnlyArtifacts();
  TestTempPathsAreUniqueAndReleased();
  TestPublishPurgesThenMoves();
  TestConcurrentPublishLeavesOneArtifact();

  std::cout << "img2reel_unit_workspace: pass\n";
  return 0;
}
