#include "main/upload_main.hpp"
#include "common/logger.hpp"
#include "common/upload_error.hpp"
#include "storage/azure_page_blob_client.hpp"
#include "upload/upload_cli.hpp"
#include "upload/upload_job.hpp"
#include "vhd/disk_stream.hpp"
#include "vhd/vhd_validator.hpp"
#include <cstdio>
#include <ctime>
#include <iostream>
#include <string>

namespace {

bool startLogging(const UploadConfig& config) {
    LogLevel level = LogLevel::INFO;
    if (!Logger::parseLevel(config.logLevel, level)) {
        std::cerr << "Unknown log level " << config.logLevel << ", using info" << std::endl;
    }
    if (!Logger::initialize(config.logFile, level)) {
        std::cerr << "Failed to initialize logger at " << config.logFile << std::endl;
        return false;
    }
    return true;
}

std::string formatVhdTime(uint32_t timestamp) {
    std::time_t t = static_cast<std::time_t>(vhd::kVhdEpochUnix + timestamp);
    std::tm gmt;
    gmtime_r(&t, &gmt);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &gmt);
    return buf;
}

void printDiskInfo(const vhd::VirtualDiskStream& stream) {
    const vhd::VhdFile& file = stream.file();
    std::cout << "Path:            " << file.path() << "\n"
              << "Disk type:       " << vhd::diskTypeName(file.diskType()) << "\n"
              << "Virtual size:    " << file.virtualSize() << " bytes\n"
              << "File size:       " << file.fileSize() << " bytes\n"
              << "Created:         " << formatVhdTime(file.timestamp()) << "\n"
              << "Unique id:       " << file.uniqueIdString() << "\n";

    if (file.isExpandable()) {
        std::cout << "Block size:      " << file.blockSize() << " bytes\n"
                  << "Table entries:   " << file.blockCount() << "\n"
                  << "Allocated:       " << file.allocatedBlockCount() << " block(s)\n";
    }
    for (const vhd::VhdFile* layer = file.parent(); layer != nullptr; layer = layer->parent()) {
        std::cout << "Parent:          " << layer->path() << " (" << vhd::diskTypeName(layer->diskType()) << ")\n";
    }

    std::vector<ByteRange> allocated = stream.allocatedRanges();
    std::cout << "Stream size:     " << stream.size() << " bytes\n"
              << "Allocated spans: " << allocated.size() << ", " << ranges::totalLength(allocated) << " bytes\n";
}

} // namespace

void printUploadUsage() {
    std::cout << "Usage: vhdupload upload [options]\n"
              << "Uploads a local VHD to a page blob, sending only allocated non-zero pages.\n"
              << "An interrupted upload resumes when the same command is run again.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help                Show this help message\n"
              << "  --localvhdpath PATH       Local VHD to upload (required)\n"
              << "  --stgaccountname NAME     Storage account name (required)\n"
              << "  --stgaccountkey KEY       Storage account key (or AZURE_STORAGE_KEY)\n"
              << "  --sastoken TOKEN          Shared access signature instead of the key\n"
              << "  --endpoint URL            Blob service endpoint (default https://<account>.blob.core.windows.net)\n"
              << "  --containername NAME      Destination container (default vhds)\n"
              << "  --blobname NAME           Destination blob, .vhd is appended when missing (required)\n"
              << "  --parallelism N           Concurrent uploads (default 8 x CPU count)\n"
              << "  --overwrite               Replace an existing blob instead of resuming\n"
              << "  --max-retries N           Retries per range on transient errors (default 5)\n"
              << "  --config FILE             JSON file with default settings\n"
              << "  --log-file PATH           Log file (default /tmp/vhdupload.log)\n"
              << "  --log-level LEVEL         debug, info, warning, error or fatal\n";
}

void printInfoUsage() {
    std::cout << "Usage: vhdupload info --localvhdpath PATH\n"
              << "Prints the decoded footer, header and allocation summary of a VHD.\n";
}

std::string describeUploadFailure(const std::exception& e) {
    if (dynamic_cast<const MetadataMismatchError*>(&e) != nullptr) {
        return "Cannot resume upload: " + std::string(e.what()) + "\nUse --overwrite to replace the existing blob.";
    }
    if (dynamic_cast<const UploadError*>(&e) != nullptr) {
        return e.what();
    }
    return "Upload failed: " + std::string(e.what());
}

int uploadMain(int argc, char* argv[]) {
    UploadConfig config;
    UploadCLI cli;
    bool parsed = cli.parse(argc, argv, config);
    if (cli.helpRequested()) {
        printUploadUsage();
        return 0;
    }
    if (!parsed) {
        for (const auto& error : cli.errors()) {
            std::cerr << "Error: " << error << std::endl;
        }
        printUploadUsage();
        return 1;
    }

    if (!startLogging(config)) {
        return 1;
    }

    try {
        AzurePageBlobClient client(toStorageAccountConfig(config));
        UploadJob job(config, client);
        UploadSummary summary = job.run();

        std::cout << (summary.resumed ? "Resumed" : "Completed") << " upload of " << config.localVhdPath << " to "
                  << client.endpoint() << "/" << config.containerName << "/" << normalizeBlobName(config.blobName)
                  << ": " << summary.transmittedBytes << " bytes sent, "
                  << summary.plan.alreadyProcessedBytes + summary.plan.zeroBytesDropped << " bytes skipped"
                  << std::endl;
        Logger::shutdown();
        return 0;
    } catch (const std::exception& e) {
        // ERROR lines already reach stderr through the logger
        Logger::error(describeUploadFailure(e));
    }
    Logger::shutdown();
    return 1;
}

int infoMain(int argc, char* argv[]) {
    std::string path;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printInfoUsage();
            return 0;
        } else if (arg == "--localvhdpath" && i + 1 < argc) {
            path = argv[++i];
        }
    }
    if (path.empty()) {
        std::cerr << "Error: --localvhdpath is required" << std::endl;
        printInfoUsage();
        return 1;
    }

    try {
        vhd::VirtualDiskStream stream(vhd::validateVhd(path));
        printDiskInfo(stream);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
