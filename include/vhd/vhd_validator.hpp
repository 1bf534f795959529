#pragma once

#include "vhd/vhd_file.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace vhd {

// Opens the file and its whole parent chain; throws FormatError on any structural defect
std::unique_ptr<VhdFile> validateVhd(const std::string& path);

// Throws SizeConstraintError unless the virtual size is a positive whole multiple of sizeUnit
void validateVhdSize(const VhdFile& file, uint64_t sizeUnit);

} // namespace vhd
