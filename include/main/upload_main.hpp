#pragma once

#include <exception>
#include <string>

// Print the upload command usage information
void printUploadUsage();

// Print the info command usage information
void printInfoUsage();

// Message logged once when an upload ends with e
std::string describeUploadFailure(const std::exception& e);

// Main entry point for the upload command
int uploadMain(int argc, char* argv[]);

// Main entry point for the info command: decodes a VHD without contacting the store
int infoMain(int argc, char* argv[]);
