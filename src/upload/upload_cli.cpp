#include "upload/upload_cli.hpp"
#include "common/logger.hpp"
#include <cstdlib>
#include <stdexcept>

bool UploadCLI::parse(int argc, char* argv[], UploadConfig& config) {
    errors_.clear();
    helpRequested_ = false;

    // The config file is the lowest-priority source after the defaults
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            try {
                loadUploadConfigFile(argv[++i], config);
            } catch (const std::runtime_error& e) {
                errors_.push_back(e.what());
            }
        }
    }

    const char* envKey = std::getenv("AZURE_STORAGE_KEY");
    if (envKey != nullptr && *envKey != '\0') {
        config.accountKey = envKey;
    }

    applyFlags(argc, argv, config);
    if (helpRequested_) {
        return true;
    }

    config.blobName = normalizeBlobName(config.blobName);

    std::vector<std::string> problems = validateUploadConfig(config);
    errors_.insert(errors_.end(), problems.begin(), problems.end());
    return errors_.empty();
}

void UploadCLI::applyFlags(int argc, char* argv[], UploadConfig& config) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            helpRequested_ = true;
            return;
        }
        if (arg == "--overwrite") {
            config.overwrite = true;
            continue;
        }

        if (arg.compare(0, 2, "--") != 0) {
            errors_.push_back("Unexpected argument: " + arg);
            continue;
        }
        if (i + 1 >= argc) {
            errors_.push_back("Missing value for " + arg);
            continue;
        }
        std::string value = argv[++i];

        if (arg == "--config") {
            // Loaded before the flags
        } else if (arg == "--localvhdpath") {
            config.localVhdPath = value;
        } else if (arg == "--stgaccountname") {
            config.accountName = value;
        } else if (arg == "--stgaccountkey") {
            config.accountKey = value;
            Logger::debug("Parsed storage account key: [REDACTED]");
        } else if (arg == "--sastoken") {
            config.sasToken = value;
        } else if (arg == "--endpoint") {
            config.blobEndpoint = value;
        } else if (arg == "--containername") {
            config.containerName = value;
        } else if (arg == "--blobname") {
            config.blobName = value;
        } else if (arg == "--parallelism") {
            parseInt(arg, value, config.parallelism);
        } else if (arg == "--max-retries") {
            parseInt(arg, value, config.maxRetries);
        } else if (arg == "--log-file") {
            config.logFile = value;
        } else if (arg == "--log-level") {
            config.logLevel = value;
        } else {
            errors_.push_back("Unknown option: " + arg);
        }
    }
}

void UploadCLI::parseInt(const std::string& flag, const std::string& value, int& target) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        target = parsed;
    } catch (const std::exception&) {
        errors_.push_back("Invalid number for " + flag + ": " + value);
    }
}
