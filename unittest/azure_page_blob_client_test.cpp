#include <gtest/gtest.h>
#include "common/upload_error.hpp"
#include "storage/azure_page_blob_client.hpp"
#include "storage/shared_key_signer.hpp"
#include <stdexcept>

namespace {

StorageRequest writePagesRequest() {
    StorageRequest request;
    request.method = "PUT";
    request.path = "/vhds/disk.vhd";
    request.query["comp"] = "page";
    request.headers["x-ms-version"] = "2020-10-02";
    request.headers["x-ms-date"] = "Mon, 01 Jan 2024 00:00:00 GMT";
    request.headers["x-ms-range"] = "bytes=0-511";
    request.headers["x-ms-page-write"] = "update";
    request.headers["Content-Type"] = "application/octet-stream";
    request.contentLength = 512;
    return request;
}

} // namespace

TEST(SharedKeySignerTest, BuildsCanonicalStringToSign) {
    SharedKeySigner signer("acct", "a2V5a2V5a2V5a2V5");
    std::string expected =
        "PUT\n"
        "\n"                            // Content-Encoding
        "\n"                            // Content-Language
        "512\n"                         // Content-Length
        "\n"                            // Content-MD5
        "application/octet-stream\n"
        "\n\n\n\n\n\n"                  // Date, conditional headers, Range
        "x-ms-date:Mon, 01 Jan 2024 00:00:00 GMT\n"
        "x-ms-page-write:update\n"
        "x-ms-range:bytes=0-511\n"
        "x-ms-version:2020-10-02\n"
        "/acct/vhds/disk.vhd\n"
        "comp:page";
    EXPECT_EQ(signer.stringToSign(writePagesRequest()), expected);
}

TEST(SharedKeySignerTest, ZeroContentLengthIsEmpty) {
    SharedKeySigner signer("acct", "a2V5");
    StorageRequest request;
    request.method = "GET";
    request.path = "/vhds/disk.vhd";
    request.query["marker"] = "m1";
    request.query["comp"] = "pagelist";

    std::string toSign = signer.stringToSign(request);
    EXPECT_EQ(toSign.substr(0, 15), "GET\n\n\n\n\n\n\n\n\n\n\n\n");
    EXPECT_NE(toSign.find("/acct/vhds/disk.vhd\ncomp:pagelist\nmarker:m1"), std::string::npos);
}

TEST(SharedKeySignerTest, SignsWithHmacSha256) {
    SharedKeySigner signer("acct", "a2V5a2V5a2V5a2V5");
    EXPECT_EQ(signer.authorization(writePagesRequest()),
              "SharedKey acct:WH+qXZ1KkoHdOfcHIC9ZE7SOtkdIyD/NcDTMBl+XTXw=");
}

TEST(SharedKeySignerTest, RejectsUnusableKey) {
    EXPECT_THROW(SharedKeySigner("acct", ""), std::invalid_argument);
    EXPECT_THROW(SharedKeySigner("acct", "abc"), std::invalid_argument);
}

TEST(AzurePageBlobClientTest, ParsesPageListWithMarker) {
    std::string xml =
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
        "<PageList>"
        "<PageRange><Start>0</Start><End>511</End></PageRange>\n"
        "<PageRange>\n  <Start>4194304</Start>\n  <End>8388607</End>\n</PageRange>"
        "<ClearRange><Start>512</Start><End>1023</End></ClearRange>"
        "<NextMarker>2!MDAwMDE0</NextMarker>"
        "</PageList>";

    PageRangeBatch batch = AzurePageBlobClient::parsePageList(xml);
    std::vector<ByteRange> expected{{0, 511}, {4194304, 8388607}};
    EXPECT_EQ(batch.ranges, expected);
    EXPECT_EQ(batch.nextMarker, "2!MDAwMDE0");
}

TEST(AzurePageBlobClientTest, ParsesFinalPageList) {
    PageRangeBatch batch = AzurePageBlobClient::parsePageList("<PageList><NextMarker /></PageList>");
    EXPECT_TRUE(batch.ranges.empty());
    EXPECT_TRUE(batch.nextMarker.empty());
}

TEST(AzurePageBlobClientTest, ParsesErrorCode) {
    std::string xml =
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
        "<Error><Code>ContainerAlreadyExists</Code><Message>The specified container already exists.</Message></Error>";
    EXPECT_EQ(AzurePageBlobClient::parseErrorCode(xml), "ContainerAlreadyExists");
    EXPECT_EQ(AzurePageBlobClient::parseErrorCode(""), "");
}

TEST(AzurePageBlobClientTest, ClassifiesRetryableStatuses) {
    for (long status : {408L, 429L, 500L, 503L}) {
        try {
            AzurePageBlobClient::classifyStatus(status, "Write pages", "ServerBusy");
            FAIL() << "No exception for " << status;
        } catch (const TransientTransferError& e) {
            EXPECT_EQ(e.httpStatus(), status);
        }
    }
}

TEST(AzurePageBlobClientTest, ClassifiesPermanentStatuses) {
    for (long status : {400L, 403L, 404L, 412L}) {
        try {
            AzurePageBlobClient::classifyStatus(status, "Write pages", "AuthenticationFailed");
            FAIL() << "No exception for " << status;
        } catch (const StoreError& e) {
            EXPECT_EQ(e.httpStatus(), status);
            EXPECT_EQ(e.errorCode(), "AuthenticationFailed");
        }
    }
}

TEST(AzurePageBlobClientTest, RequiresCredentials) {
    StorageAccountConfig config;
    config.accountName = "acct";
    EXPECT_THROW(AzurePageBlobClient client(config), std::invalid_argument);

    config.accountName.clear();
    config.accountKey = "a2V5";
    EXPECT_THROW(AzurePageBlobClient client(config), std::invalid_argument);
}

TEST(AzurePageBlobClientTest, DerivesEndpoint) {
    StorageAccountConfig config;
    config.accountName = "acct";
    config.accountKey = "a2V5";
    AzurePageBlobClient publicCloud(config);
    EXPECT_EQ(publicCloud.endpoint(), "https://acct.blob.core.windows.net");

    config.accountKey.clear();
    config.sasToken = "?sv=2020-10-02&sig=abc";
    config.blobEndpoint = "http://127.0.0.1:10000/devstoreaccount1/";
    AzurePageBlobClient emulator(config);
    EXPECT_EQ(emulator.endpoint(), "http://127.0.0.1:10000");
}
