#include <docpatch-cpp/error.hpp>
#include <docpatch-cpp/store.hpp>

#include <gtest/gtest.h>

#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace dp = docpatch_cpp;
namespace fs = std::filesystem;

namespace {

// 2024-03-05T06:07:08Z
const auto fixed_time = std::chrono::system_clock::from_time_t(1709618828);

void write_text(const fs::path& path, const std::string& text) {
    auto out = std::ofstream{path, std::ios::binary};
    out << text;
}

auto read_text(const fs::path& path) -> std::string {
    return dp::read_file(path);
}

auto entries(const fs::path& dir) -> std::vector<std::string> {
    auto names = std::vector<std::string>{};
    for (const auto& entry : fs::directory_iterator{dir}) {
        names.push_back(entry.path().filename().string());
    }
    return names;
}

template <typename Fn>
auto error_kind(Fn&& fn) -> std::optional<dp::ErrorKind> {
    try {
        fn();
    } catch (const dp::Error& e) {
        return e.kind();
    }
    return std::nullopt;
}

class StoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               (std::string{"docpatch_store_"} + info->name() + "_" +
                std::to_string(static_cast<long>(::getpid())));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        auto ec = std::error_code{};
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

}  // anonymous namespace

// -- Loading ------------------------------------------------------------------

TEST_F(StoreTest, load_returns_document_and_exact_bytes) {
    const auto path = dir_ / "plan.json";
    write_text(path, "{ \"a\" : [1, 2] }\n");
    const auto loaded = dp::load_document(path);
    EXPECT_EQ(loaded.bytes, "{ \"a\" : [1, 2] }\n");
    EXPECT_EQ(loaded.document, dp::parse_document(R"({"a":[1,2]})"));
}

TEST_F(StoreTest, load_missing_file_is_io_error) {
    EXPECT_EQ(error_kind([&] { dp::load_document(dir_ / "absent.json"); }),
              dp::ErrorKind::io_error);
}

TEST_F(StoreTest, load_invalid_json_names_the_file) {
    const auto path = dir_ / "broken.json";
    write_text(path, "{\"a\": ");
    try {
        dp::load_document(path);
        FAIL() << "expected an error";
    } catch (const dp::Error& e) {
        EXPECT_EQ(e.kind(), dp::ErrorKind::parse_error);
        EXPECT_NE(std::string{e.what()}.find("broken.json"), std::string::npos);
    }
}

// -- Backup naming ------------------------------------------------------------

TEST(BackupPath, embeds_utc_timestamp_and_digest_prefix) {
    const auto digest = dp::sha256_hex("abc");
    EXPECT_EQ(dp::backup_path_for("/data/plan.json", fixed_time, digest),
              fs::path{"/data/plan.json.bak.20240305T060708Z.ba7816bf"});
}

// -- Commits ------------------------------------------------------------------

TEST_F(StoreTest, commit_writes_serialized_document) {
    const auto path = dir_ / "plan.json";
    const auto doc = dp::parse_document(R"({"b":1,"a":"é"})");
    const auto result = dp::commit_document(path, doc);

    EXPECT_EQ(result.path, path);
    EXPECT_EQ(read_text(path), dp::serialize(doc));
    EXPECT_EQ(result.digest, dp::sha256_hex(dp::serialize(doc)));
    EXPECT_EQ(result.digest.size(), 64u);
}

TEST_F(StoreTest, first_commit_has_no_backup) {
    const auto path = dir_ / "plan.json";
    const auto result = dp::commit_document(path, dp::Document::object());
    EXPECT_FALSE(result.backup_path.has_value());
    EXPECT_EQ(entries(dir_), std::vector<std::string>{"plan.json"});
}

TEST_F(StoreTest, backup_preserves_previous_bytes) {
    const auto path = dir_ / "plan.json";
    write_text(path, "{\"version\": 1}\n");

    auto options = dp::CommitOptions{};
    options.timestamp = fixed_time;
    const auto doc = dp::parse_document(R"({"version":2})");
    const auto result = dp::commit_document(path, doc, options);

    ASSERT_TRUE(result.backup_path.has_value());
    EXPECT_EQ(*result.backup_path, dp::backup_path_for(path, fixed_time, result.digest));
    EXPECT_EQ(read_text(*result.backup_path), "{\"version\": 1}\n");
    EXPECT_EQ(read_text(path), dp::serialize(doc));
}

TEST_F(StoreTest, successive_commits_build_a_backup_chain) {
    const auto path = dir_ / "plan.json";
    dp::commit_document(path, dp::parse_document(R"({"v":1})"));

    auto options = dp::CommitOptions{};
    options.timestamp = fixed_time;
    const auto second = dp::commit_document(path, dp::parse_document(R"({"v":2})"), options);
    options.timestamp = fixed_time + std::chrono::seconds{1};
    const auto third = dp::commit_document(path, dp::parse_document(R"({"v":3})"), options);

    ASSERT_TRUE(second.backup_path && third.backup_path);
    EXPECT_NE(*second.backup_path, *third.backup_path);
    EXPECT_EQ(dp::load_document(*second.backup_path).document, dp::parse_document(R"({"v":1})"));
    EXPECT_EQ(dp::load_document(*third.backup_path).document, dp::parse_document(R"({"v":2})"));
    EXPECT_EQ(entries(dir_).size(), 3u);
}

TEST_F(StoreTest, same_second_backups_of_identical_content_do_not_collide) {
    const auto path = dir_ / "plan.json";
    write_text(path, "{\"v\": 1}");

    auto options = dp::CommitOptions{};
    options.timestamp = fixed_time;
    const auto doc = dp::parse_document(R"({"v":2})");
    const auto first = dp::commit_document(path, doc, options);
    const auto second = dp::commit_document(path, doc, options);

    ASSERT_TRUE(first.backup_path && second.backup_path);
    EXPECT_EQ(*first.backup_path, dp::backup_path_for(path, fixed_time, first.digest));
    EXPECT_EQ(*second.backup_path, fs::path{first.backup_path->string() + ".1"});
    EXPECT_EQ(read_text(*first.backup_path), "{\"v\": 1}");
    EXPECT_EQ(read_text(*second.backup_path), dp::serialize(doc));
    EXPECT_EQ(entries(dir_).size(), 3u);
}

TEST_F(StoreTest, no_backup_when_disabled) {
    const auto path = dir_ / "plan.json";
    write_text(path, "{}");
    auto options = dp::CommitOptions{};
    options.make_backup = false;
    const auto result = dp::commit_document(path, dp::parse_document("[1]"), options);

    EXPECT_FALSE(result.backup_path.has_value());
    EXPECT_EQ(entries(dir_), std::vector<std::string>{"plan.json"});
    EXPECT_EQ(read_text(path), "[\n  1\n]");
}

TEST_F(StoreTest, commit_bytes_writes_exactly) {
    const auto path = dir_ / "raw.json";
    const auto result = dp::commit_bytes(path, "[1,2]\n");
    EXPECT_EQ(read_text(path), "[1,2]\n");
    EXPECT_EQ(result.digest, dp::sha256_hex("[1,2]\n"));
}

TEST_F(StoreTest, creates_missing_directories) {
    const auto path = dir_ / "nested" / "deeper" / "plan.json";
    dp::commit_document(path, dp::Document::object());
    EXPECT_TRUE(fs::exists(path));
}

TEST_F(StoreTest, keeps_permissions_of_replaced_file) {
    const auto path = dir_ / "plan.json";
    write_text(path, "{}");
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read);

    dp::commit_document(path, dp::parse_document(R"({"a":1})"));

    struct stat st {};
    ASSERT_EQ(::stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 07777, 0640u);
}

TEST_F(StoreTest, failed_commit_leaves_target_and_no_temporary_files) {
    // A directory cannot be replaced by a file, so the final rename fails
    const auto path = dir_ / "occupied";
    fs::create_directories(path / "child");

    auto options = dp::CommitOptions{};
    options.make_backup = false;
    EXPECT_EQ(error_kind([&] { dp::commit_document(path, dp::Document::object(), options); }),
              dp::ErrorKind::io_error);

    EXPECT_TRUE(fs::is_directory(path / "child"));
    EXPECT_EQ(entries(dir_), std::vector<std::string>{"occupied"});
}

TEST_F(StoreTest, failed_backup_aborts_before_rename) {
    const auto path = dir_ / "occupied";
    fs::create_directories(path);

    EXPECT_EQ(error_kind([&] { dp::commit_document(path, dp::Document::object()); }),
              dp::ErrorKind::io_error);
    EXPECT_TRUE(fs::is_directory(path));
    EXPECT_EQ(entries(dir_), std::vector<std::string>{"occupied"});
}

TEST_F(StoreTest, load_after_commit_round_trips) {
    const auto path = dir_ / "plan.json";
    const auto doc = dp::parse_document(R"({"z":[{"k":null}],"a":true})");
    const auto result = dp::commit_document(path, doc);
    const auto loaded = dp::load_document(path);
    EXPECT_EQ(loaded.document, doc);
    EXPECT_EQ(dp::sha256_hex(loaded.bytes), result.digest);
}

TEST_F(StoreTest, unreadable_target_status_fails_the_commit) {
    // A self-referencing symlink makes stat fail with ELOOP
    const auto path = dir_ / "loop";
    fs::create_symlink("loop", path);

    EXPECT_EQ(error_kind([&] { dp::commit_document(path, dp::Document::object()); }),
              dp::ErrorKind::io_error);
    EXPECT_TRUE(fs::is_symlink(fs::symlink_status(path)));
    EXPECT_EQ(entries(dir_), std::vector<std::string>{"loop"});
}
