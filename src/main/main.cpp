#include "main/upload_main.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>

void printUsage() {
    std::cout << "Usage: vhdupload [command] [options]\n"
              << "Commands:\n"
              << "  upload    - Upload a local VHD to a page blob, resuming partial uploads\n"
              << "  info      - Show the structure of a local VHD\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help    Show this help message\n"
              << "  -v, --version Show version information\n";
}

int main(int argc, char** argv) {
    if (argc > 1 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        printUsage();
        return 0;
    }

    if (argc > 1 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "vhdupload version 1.0.0\n";
        return 0;
    }

    if (argc < 2) {
        std::cerr << "Error: No command specified" << std::endl;
        printUsage();
        return 1;
    }

    std::string command = argv[1];
    try {
        if (command == "upload") {
            return uploadMain(argc - 1, argv + 1);
        } else if (command == "info") {
            return infoMain(argc - 1, argv + 1);
        } else {
            std::cerr << "Error: Unknown command: " << command << std::endl;
            printUsage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        if (Logger::isInitialized()) {
            Logger::error("Error in main: " + std::string(e.what()));
        }
        return 1;
    }
}
