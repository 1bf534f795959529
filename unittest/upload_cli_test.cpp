#include <gtest/gtest.h>
#include "common/upload_error.hpp"
#include "main/upload_main.hpp"
#include "upload/upload_cli.hpp"
#include "vhd_test_image.hpp"
#include <cstdlib>
#include <fstream>

class UploadCLITest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("AZURE_STORAGE_KEY");
    }

    void TearDown() override {
        unsetenv("AZURE_STORAGE_KEY");
    }

    bool parse(const std::vector<std::string>& args, UploadConfig& config) {
        storage_ = args;
        storage_.insert(storage_.begin(), "upload");
        argv_.clear();
        for (auto& arg : storage_) {
            argv_.push_back(&arg[0]);
        }
        return cli_.parse(static_cast<int>(argv_.size()), argv_.data(), config);
    }

    bool hasError(const std::string& fragment) const {
        for (const auto& error : cli_.errors()) {
            if (error.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    UploadCLI cli_;
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

TEST_F(UploadCLITest, ParsesRequiredFlags) {
    UploadConfig config;
    ASSERT_TRUE(parse({"--localvhdpath", "/data/disk.vhd", "--stgaccountname", "acct", "--stgaccountkey", "a2V5",
                       "--blobname", "target", "--containername", "images", "--parallelism", "16",
                       "--overwrite"}, config));

    EXPECT_EQ(config.localVhdPath, "/data/disk.vhd");
    EXPECT_EQ(config.accountName, "acct");
    EXPECT_EQ(config.accountKey, "a2V5");
    EXPECT_EQ(config.blobName, "target.vhd");
    EXPECT_EQ(config.containerName, "images");
    EXPECT_EQ(config.parallelism, 16);
    EXPECT_TRUE(config.overwrite);
    EXPECT_EQ(config.maxRetries, 5);
    EXPECT_TRUE(cli_.errors().empty());
}

TEST_F(UploadCLITest, KeepsExistingVhdExtension) {
    UploadConfig config;
    ASSERT_TRUE(parse({"--localvhdpath", "d.vhd", "--stgaccountname", "acct", "--sastoken", "sv=1&sig=x",
                       "--blobname", "Disk.VHD"}, config));
    EXPECT_EQ(config.blobName, "Disk.VHD");
    EXPECT_EQ(config.sasToken, "sv=1&sig=x");
}

TEST_F(UploadCLITest, CollectsAllMissingArguments) {
    UploadConfig config;
    EXPECT_FALSE(parse({}, config));

    EXPECT_TRUE(hasError("--localvhdpath"));
    EXPECT_TRUE(hasError("--stgaccountname"));
    EXPECT_TRUE(hasError("--blobname"));
    EXPECT_TRUE(hasError("--stgaccountkey"));
    EXPECT_GE(cli_.errors().size(), 4u);
}

TEST_F(UploadCLITest, RejectsBadValues) {
    UploadConfig config;
    EXPECT_FALSE(parse({"--localvhdpath", "d.vhd", "--stgaccountname", "acct", "--stgaccountkey", "a2V5",
                        "--blobname", "b", "--parallelism", "many", "--log-level", "loud", "--bogus", "1"}, config));

    EXPECT_TRUE(hasError("Invalid number for --parallelism"));
    EXPECT_TRUE(hasError("Unknown log level"));
    EXPECT_TRUE(hasError("Unknown option: --bogus"));
}

TEST_F(UploadCLITest, HelpShortCircuitsValidation) {
    UploadConfig config;
    EXPECT_TRUE(parse({"--help"}, config));
    EXPECT_TRUE(cli_.helpRequested());
}

TEST_F(UploadCLITest, ReadsKeyFromEnvironment) {
    setenv("AZURE_STORAGE_KEY", "ZW52", 1);
    UploadConfig config;
    ASSERT_TRUE(parse({"--localvhdpath", "d.vhd", "--stgaccountname", "acct", "--blobname", "b"}, config));
    EXPECT_EQ(config.accountKey, "ZW52");

    UploadConfig overridden;
    ASSERT_TRUE(parse({"--localvhdpath", "d.vhd", "--stgaccountname", "acct", "--blobname", "b",
                       "--stgaccountkey", "ZmxhZw=="}, overridden));
    EXPECT_EQ(overridden.accountKey, "ZmxhZw==");
}

TEST_F(UploadCLITest, FlagsOverrideConfigFile) {
    testimage::TempDir dir;
    std::string path = dir.file("upload.json");
    std::ofstream(path) << R"({
        "localVhdPath": "/from/file.vhd",
        "accountName": "fileacct",
        "accountKey": "a2V5",
        "blobName": "fromfile",
        "maxRetries": 9,
        "retryDelayMs": 10,
        "pageSetSize": 2097152
    })";

    UploadConfig config;
    ASSERT_TRUE(parse({"--config", path, "--stgaccountname", "flagacct"}, config));
    EXPECT_EQ(config.localVhdPath, "/from/file.vhd");
    EXPECT_EQ(config.accountName, "flagacct");
    EXPECT_EQ(config.blobName, "fromfile.vhd");
    EXPECT_EQ(config.maxRetries, 9);
    EXPECT_EQ(config.retryDelayMs, 10);
    EXPECT_EQ(config.pageSetSize, 2097152u);
}

TEST_F(UploadCLITest, ReportsUnreadableConfigFile) {
    testimage::TempDir dir;
    std::string path = dir.file("broken.json");
    std::ofstream(path) << "{ not json";

    UploadConfig config;
    EXPECT_FALSE(parse({"--config", path}, config));
    EXPECT_TRUE(hasError("Invalid config file"));

    UploadConfig missing;
    EXPECT_FALSE(parse({"--config", dir.file("absent.json")}, missing));
    EXPECT_TRUE(hasError("Cannot open config file"));
}

TEST(UploadConfigTest, NormalizesBlobNames) {
    EXPECT_EQ(normalizeBlobName("disk"), "disk.vhd");
    EXPECT_EQ(normalizeBlobName("disk.vhd"), "disk.vhd");
    EXPECT_EQ(normalizeBlobName("disk.Vhd"), "disk.Vhd");
    EXPECT_EQ(normalizeBlobName("disk.vhdx"), "disk.vhdx.vhd");
}

TEST(UploadConfigTest, ValidatesPageGeometry) {
    UploadConfig config;
    config.localVhdPath = "d.vhd";
    config.accountName = "acct";
    config.accountKey = "a2V5";
    config.blobName = "b.vhd";
    EXPECT_TRUE(validateUploadConfig(config).empty());

    config.pageSetSize = 1000;
    EXPECT_EQ(validateUploadConfig(config).size(), 1u);

    config.pageSetSize = 4 * 1024 * 1024;
    config.pageSize = 4096;
    std::vector<std::string> errors = validateUploadConfig(config);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("footer"), std::string::npos);

    config.pageSize = 512;
    config.pageSetSize = 8 * 1024 * 1024;
    errors = validateUploadConfig(config);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("write limit"), std::string::npos);
}

TEST(UploadFailureMessageTest, EachFailureIsDescribedOnce) {
    MetadataMismatchError mismatch({"Size differs: remote 1048576, local 2097152"});
    std::string message = describeUploadFailure(mismatch);
    EXPECT_EQ(message.find("Size differs"), message.rfind("Size differs"));
    EXPECT_NE(message.find("--overwrite"), std::string::npos);

    UploadFailedError failed(ByteRange(0, 511), "connection reset");
    EXPECT_EQ(describeUploadFailure(failed), failed.what());

    std::runtime_error other("disk full");
    EXPECT_EQ(describeUploadFailure(other), "Upload failed: disk full");
}
