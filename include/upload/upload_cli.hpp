#pragma once

#include "upload/upload_config.hpp"
#include <string>
#include <vector>

/*
 * Assembles an UploadConfig from defaults, an optional --config JSON file,
 * the AZURE_STORAGE_KEY environment variable and command-line flags, later
 * sources overriding earlier ones. Problems are collected, not thrown.
 */
class UploadCLI {
public:
    UploadCLI() = default;

    // argv[0] is the command name. Returns false when errors() is not empty.
    bool parse(int argc, char* argv[], UploadConfig& config);

    bool helpRequested() const { return helpRequested_; }
    const std::vector<std::string>& errors() const { return errors_; }

private:
    void applyFlags(int argc, char* argv[], UploadConfig& config);
    void parseInt(const std::string& flag, const std::string& value, int& target);

    bool helpRequested_ = false;
    std::vector<std::string> errors_;
};
