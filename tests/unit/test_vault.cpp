#include <gtest/gtest.h>
#include "televault/core/command_registry.hpp"
#include "televault/core/vault.hpp"
#include "televault/crypto/encryption.hpp"
#include "televault/remote/memory_channel.hpp"
#include <filesystem>
#include <fstream>

using namespace televault;
using core::Vault;
using core::VaultError;

namespace {

std::vector<uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

}

class VaultTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!crypto::EncryptionEngine::is_available()) {
            GTEST_SKIP() << "AES-256-GCM not available on this CPU";
        }
        test_dir_ = std::filesystem::temp_directory_path() / "televault_vault_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        channel_ = std::make_shared<remote::MemoryChannel>();
        vault_ = std::make_unique<Vault>(channel_, vault_config());
        ASSERT_TRUE(vault_->open());
    }

    void TearDown() override {
        vault_.reset();
        std::filesystem::remove_all(test_dir_);
    }

    storage::VaultConfig vault_config() const {
        storage::VaultConfig config;
        config.chunk_size = 64 * 1024;
        config.retry_delay = std::chrono::milliseconds(1);
        config.kdf.n = 1024;
        config.data_dir = test_dir_ / "state";
        return config;
    }

    std::filesystem::path write_source(const std::string& relative, const std::string& content) {
        auto path = test_dir_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary) << content;
        return path;
    }

    std::string push(const std::string& relative, const std::string& content) {
        transfer::UploadOutcome outcome;
        auto status = vault_->push(write_source(relative, content), password_, outcome);
        EXPECT_TRUE(status) << status.describe();
        return outcome.record.file_id;
    }

    std::filesystem::path test_dir_;
    std::shared_ptr<remote::MemoryChannel> channel_;
    std::unique_ptr<Vault> vault_;
    std::string password_ = "hunter2";
};

TEST_F(VaultTest, OperationsNeedOpenVault) {
    Vault closed(channel_, vault_config());
    transfer::UploadOutcome outcome;
    EXPECT_EQ(closed.push(write_source("a.txt", "a"), password_, outcome).error, VaultError::INVALID_STATE);
    EXPECT_EQ(closed.pull("a.txt", {}, password_).error, VaultError::INVALID_STATE);
    EXPECT_EQ(closed.remove("a.txt").error, VaultError::INVALID_STATE);

    storage::FileRecord record;
    std::vector<storage::FileRecord> records;
    core::VaultStatus status;
    EXPECT_EQ(closed.list(records).error, VaultError::INVALID_STATE);
    auto info = closed.info("a.txt", record);
    EXPECT_EQ(info.error, VaultError::INVALID_STATE);
    EXPECT_EQ(info.operation, "info");
    EXPECT_EQ(closed.search("a", records).error, VaultError::INVALID_STATE);
    auto summary = closed.status(status);
    EXPECT_EQ(summary.error, VaultError::INVALID_STATE);
    EXPECT_EQ(summary.operation, "status");
}

TEST_F(VaultTest, OpenRejectsChunksLargerThanChannelAllows) {
    auto small = std::make_shared<remote::MemoryChannel>(1024);
    Vault vault(small, vault_config());
    EXPECT_EQ(vault.open().error, VaultError::CHUNK_SIZE_EXCEEDS_LIMIT);
}

TEST_F(VaultTest, PushThenPullByNameAndId) {
    std::string content(200 * 1024, 'x');
    auto id = push("docs/report.txt", content);

    std::filesystem::path written;
    ASSERT_TRUE(vault_->pull("report.txt", test_dir_ / "by_name.txt", password_, &written));
    EXPECT_EQ(written, test_dir_ / "by_name.txt");
    ASSERT_TRUE(vault_->pull(id, test_dir_ / "by_id.txt", password_));

    std::vector<uint8_t> expected(content.begin(), content.end());
    EXPECT_EQ(read_file(test_dir_ / "by_name.txt"), expected);
    EXPECT_EQ(read_file(test_dir_ / "by_id.txt"), expected);
}

TEST_F(VaultTest, PullWithoutOutputUsesStoredName) {
    push("in/photo.raw", "pixels");
    auto previous = std::filesystem::current_path();
    auto out_dir = test_dir_ / "out";
    std::filesystem::create_directories(out_dir);
    std::filesystem::current_path(out_dir);

    std::filesystem::path written;
    auto status = vault_->pull("photo.raw", {}, password_, &written);
    std::filesystem::current_path(previous);

    ASSERT_TRUE(status) << status.describe();
    EXPECT_EQ(written.filename().string(), "photo.raw");
    EXPECT_TRUE(std::filesystem::exists(out_dir / "photo.raw"));
}

TEST_F(VaultTest, ListAndInfo) {
    auto first = push("a/alpha.txt", "alpha");
    push("b/beta.txt", "beta beta");

    std::vector<storage::FileRecord> files;
    ASSERT_TRUE(vault_->list(files));
    ASSERT_EQ(files.size(), 2u);

    storage::FileRecord record;
    ASSERT_TRUE(vault_->info(first, record));
    EXPECT_EQ(record.name, "alpha.txt");
    EXPECT_EQ(record.size, 5u);
    EXPECT_EQ(record.mime_type, "text/plain");
}

TEST_F(VaultTest, RemovedFileIsGone) {
    auto id = push("gone.txt", "bye");
    push("kept.txt", "stay");

    std::string removed;
    ASSERT_TRUE(vault_->remove("gone.txt", &removed));
    EXPECT_EQ(removed, id);

    auto status = vault_->pull(id, test_dir_ / "gone.out", password_);
    EXPECT_EQ(status.error, VaultError::NOT_FOUND_IN_CATALOG);
    EXPECT_EQ(status.operation, "pull");

    std::vector<storage::FileRecord> files;
    ASSERT_TRUE(vault_->list(files));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].name, "kept.txt");
}

TEST_F(VaultTest, PartialNameMustBeUnique) {
    push("report-2023.txt", "old");
    push("report-2024.txt", "new");

    auto status = vault_->pull("report", test_dir_ / "x", password_);
    EXPECT_EQ(status.error, VaultError::AMBIGUOUS_NAME);

    storage::FileRecord record;
    ASSERT_TRUE(vault_->info("2024", record));
    EXPECT_EQ(record.name, "report-2024.txt");

    // Deletion never guesses.
    EXPECT_EQ(vault_->remove("report").error, VaultError::NOT_FOUND_IN_CATALOG);
}

TEST_F(VaultTest, DuplicateNamesResolveById) {
    auto first = push("one/same.txt", "first");
    auto second = push("two/same.txt", "second");
    ASSERT_NE(first, second);

    EXPECT_EQ(vault_->pull("same.txt", test_dir_ / "x", password_).error, VaultError::AMBIGUOUS_NAME);
    EXPECT_EQ(vault_->remove("same.txt").error, VaultError::AMBIGUOUS_NAME);

    ASSERT_TRUE(vault_->pull(second, test_dir_ / "second.out", password_));
    EXPECT_EQ(read_file(test_dir_ / "second.out"), (std::vector<uint8_t>{'s', 'e', 'c', 'o', 'n', 'd'}));
}

TEST_F(VaultTest, SearchIgnoresCase) {
    push("Holiday-Photos.zip", "zip");
    push("notes.md", "# notes");

    std::vector<storage::FileRecord> found;
    ASSERT_TRUE(vault_->search("holiday", found));
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].name, "Holiday-Photos.zip");

    ASSERT_TRUE(vault_->search("nothing-like-this", found));
    EXPECT_TRUE(found.empty());
}

TEST_F(VaultTest, StatusSummarizesCatalog) {
    core::VaultStatus status;
    ASSERT_TRUE(vault_->status(status));
    EXPECT_EQ(status.file_count, 0u);
    EXPECT_DOUBLE_EQ(status.compression_ratio, 1.0);

    push("a.txt", std::string(10000, 'a'));
    push("b.txt", std::string(5000, 'b'));
    ASSERT_TRUE(vault_->remove("b.txt"));

    ASSERT_TRUE(vault_->status(status));
    EXPECT_EQ(status.file_count, 1u);
    EXPECT_EQ(status.total_size, 10000u);
    EXPECT_GT(status.stored_size, 0u);
    EXPECT_LT(status.compression_ratio, 1.0);
    EXPECT_EQ(status.deleted_count, 1u);
    EXPECT_EQ(status.catalog_version, 3u);
    EXPECT_EQ(status.unfinished_uploads, 0u);
}

TEST_F(VaultTest, UnreadableRecordIsSkipped) {
    push("good.txt", "good");
    remote::RemoteRef junk;
    std::string garbage = "{ not a record";
    ASSERT_TRUE(channel_->put_blob(std::vector<uint8_t>(garbage.begin(), garbage.end()), std::nullopt, junk));
    ASSERT_TRUE(vault_->catalog().link_file("bad001", junk));

    std::vector<storage::FileRecord> files;
    ASSERT_TRUE(vault_->list(files));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].name, "good.txt");
}

TEST_F(VaultTest, MissingResumeStoreOnlyDisablesResume) {
    auto blocker = test_dir_ / "blocker";
    std::ofstream(blocker) << "file";
    auto config = vault_config();
    config.data_dir = blocker / "state";

    Vault vault(channel_, config);
    ASSERT_TRUE(vault.open());
    transfer::UploadOutcome outcome;
    EXPECT_TRUE(vault.push(write_source("x.txt", "x"), password_, outcome));
}

class CommandHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!crypto::EncryptionEngine::is_available()) {
            GTEST_SKIP() << "AES-256-GCM not available on this CPU";
        }
        test_dir_ = std::filesystem::temp_directory_path() / "televault_command_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        config_.set_defaults();
        config_.set("vault.data_dir", (test_dir_ / "state").string());
        config_.set("transfer.chunk_size", "64K");
        config_.set("transfer.retry_delay", "0.001");
        config_.set("kdf.n", "1024");
        channel_ = std::make_shared<remote::MemoryChannel>();
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    core::CommandRegistry registry(core::CommandOptions options) {
        auto context = std::make_shared<core::CommandContext>(config_, std::move(options), channel_);
        return core::CommandRegistry(context);
    }

    core::CommandOptions with_password() const {
        core::CommandOptions options;
        options.password = "hunter2";
        return options;
    }

    std::filesystem::path test_dir_;
    core::Config config_;
    std::shared_ptr<remote::MemoryChannel> channel_;
};

TEST_F(CommandHandlerTest, UnknownCommandIsUsageError) {
    auto commands = registry(with_password());
    EXPECT_FALSE(commands.has_command("upload"));
    auto result = commands.execute_command("upload", {"upload"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_NE(result.message.find("push, pull, ls, info, search, rm, status"), std::string::npos);
    EXPECT_EQ(commands.command_names().front(), "push");
}

TEST_F(CommandHandlerTest, MissingArgumentsAreUsageErrors) {
    auto commands = registry(with_password());
    for (const char* name : {"push", "pull", "info", "search", "rm"}) {
        auto result = commands.execute_command(name, {name});
        EXPECT_EQ(result.exit_code, 2) << name;
    }
    EXPECT_EQ(commands.execute_command("push", {"push", (test_dir_ / "absent").string()}).exit_code, 2);
}

TEST_F(CommandHandlerTest, PushListPullRemove) {
    auto source = test_dir_ / "hello.txt";
    std::ofstream(source) << "hello from the command line";

    auto commands = registry(with_password());
    EXPECT_TRUE(commands.execute_command("push", {"push", source.string()}).success);
    EXPECT_TRUE(commands.execute_command("ls", {"ls"}).success);
    EXPECT_TRUE(commands.execute_command("info", {"info", "hello.txt"}).success);
    EXPECT_TRUE(commands.execute_command("search", {"search", "HELLO"}).success);
    EXPECT_TRUE(commands.execute_command("status", {"status"}).success);

    auto output_options = with_password();
    output_options.output = (test_dir_ / "copy.txt").string();
    auto pulling = registry(output_options);
    EXPECT_TRUE(pulling.execute_command("pull", {"pull", "hello.txt"}).success);
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "copy.txt"));

    EXPECT_TRUE(commands.execute_command("rm", {"rm", "hello.txt"}).success);
    auto missing = commands.execute_command("pull", {"pull", "hello.txt"});
    EXPECT_EQ(missing.exit_code, 1);
    EXPECT_NE(missing.message.find("NotFoundInCatalog"), std::string::npos);
}

TEST_F(CommandHandlerTest, JsonListingAndSortKeys) {
    auto options = with_password();
    options.json = true;
    options.sort = "size";
    EXPECT_TRUE(registry(options).execute_command("ls", {"ls"}).success);

    options.sort = "colour";
    EXPECT_EQ(registry(options).execute_command("ls", {"ls"}).exit_code, 2);
}

TEST_F(CommandHandlerTest, MissingPasswordIsUsageError) {
    auto source = test_dir_ / "secret.txt";
    std::ofstream(source) << "secret";
    auto result = registry(core::CommandOptions{}).execute_command("push", {"push", source.string()});
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_NE(result.message.find("MissingCredentials"), std::string::npos);
}

TEST_F(CommandHandlerTest, FlagsOverrideConfig) {
    auto options = with_password();
    options.chunk_size = "1M";
    options.no_compress = true;
    options.no_encrypt = true;
    options.parallel = 7;
    core::CommandContext context(config_, options, channel_);

    storage::VaultConfig resolved;
    ASSERT_TRUE(context.vault_config(resolved));
    EXPECT_EQ(resolved.chunk_size, 1024u * 1024u);
    EXPECT_FALSE(resolved.compression);
    EXPECT_FALSE(resolved.encryption);
    EXPECT_EQ(resolved.parallel_uploads, 7);
    EXPECT_EQ(resolved.parallel_downloads, 7);

    options.chunk_size = "lots";
    core::CommandContext bad(config_, options, channel_);
    EXPECT_EQ(bad.vault_config(resolved).error, VaultError::CONFIG_INVALID);

    options.chunk_size = "3G";
    auto result = registry(options).execute_command("status", {"status"});
    EXPECT_EQ(result.exit_code, 2);
}

TEST_F(CommandHandlerTest, ResultMapping) {
    EXPECT_EQ(core::CommandResult::from(core::VaultResult()).exit_code, 0);
    EXPECT_EQ(core::CommandResult::from(core::VaultResult(VaultError::CONFIG_INVALID, "x")).exit_code, 2);
    EXPECT_EQ(core::CommandResult::from(core::VaultResult(VaultError::TAMPERED_OR_CORRUPT, "x")).exit_code, 1);
}
