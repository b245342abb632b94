#include "credential_store.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <string>

#ifndef _WIN32
#include <sys/stat.h>
#endif

using namespace umon;
namespace fs = std::filesystem;

namespace {

fs::path scratch_dir(const std::string &name) {
  fs::path dir = fs::temp_directory_path() / ("umon_credentials_" + name);
  fs::remove_all(dir);
  return dir;
}

} // namespace

TEST_CASE("credential files round trip in every format", "[credentials]") {
  auto dir = scratch_dir("formats");
  for (const char *name : {"creds.json", "creds.yaml", "creds.toml"}) {
    FileCredentialStore store((dir / "nested" / name).string());
    CHECK_FALSE(store.load());
    store.save({"org-42", "sk-ant-sid01-secret"});
    auto loaded = store.load();
    REQUIRE(loaded);
    CHECK(loaded->organization_id == "org-42");
    CHECK(loaded->session_token == "sk-ant-sid01-secret");
    store.remove();
    CHECK_FALSE(store.load());
  }
  fs::remove_all(dir);
}

TEST_CASE("credential file is owner-only", "[credentials]") {
#ifndef _WIN32
  auto dir = scratch_dir("perms");
  FileCredentialStore store((dir / "creds.json").string());
  store.save({"org", "token"});
  struct stat st {};
  REQUIRE(::stat(store.path().c_str(), &st) == 0);
  CHECK((st.st_mode & 0777) == 0600);
  fs::remove_all(dir);
#endif
}

TEST_CASE("unreadable credential files load as empty", "[credentials]") {
  auto dir = scratch_dir("corrupt");
  fs::create_directories(dir);
  {
    std::ofstream out(dir / "broken.json");
    out << "{not json";
  }
  {
    std::ofstream out(dir / "partial.json");
    out << R"({"organization_id": "org-only"})";
  }
  CHECK_FALSE(FileCredentialStore((dir / "broken.json").string()).load());
  CHECK_FALSE(FileCredentialStore((dir / "partial.json").string()).load());
  fs::remove_all(dir);
}

TEST_CASE("removing missing credentials succeeds", "[credentials]") {
  auto dir = scratch_dir("missing");
  FileCredentialStore store((dir / "none.json").string());
  CHECK_NOTHROW(store.remove());
}

TEST_CASE("memory credential store", "[credentials]") {
  MemoryCredentialStore store;
  CHECK_FALSE(store.load());
  store.save({"org", "token"});
  REQUIRE(store.load());
  CHECK(store.load()->organization_id == "org");
  store.remove();
  CHECK_FALSE(store.load());
}
