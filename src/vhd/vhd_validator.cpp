#include "vhd/vhd_validator.hpp"
#include "common/logger.hpp"
#include "common/upload_error.hpp"
#include <stdexcept>

namespace vhd {

std::unique_ptr<VhdFile> validateVhd(const std::string& path) {
    Logger::info("Validating VHD " + path);
    std::unique_ptr<VhdFile> file = VhdFile::open(path);

    int depth = 0;
    for (const VhdFile* layer = file->parent(); layer != nullptr; layer = layer->parent()) {
        ++depth;
    }
    Logger::info("VHD " + path + " is a valid " + diskTypeName(file->diskType()) + " disk" +
                 (depth > 0 ? " with " + std::to_string(depth) + " parent(s)" : std::string()));
    return file;
}

void validateVhdSize(const VhdFile& file, uint64_t sizeUnit) {
    if (sizeUnit == 0) {
        throw std::invalid_argument("size unit must be positive");
    }

    uint64_t size = file.virtualSize();
    if (size == 0 || size % sizeUnit != 0) {
        throw SizeConstraintError("Virtual size of " + file.path() + " (" + std::to_string(size) +
                                  " bytes) is not a whole multiple of " + std::to_string(sizeUnit) + " bytes");
    }
}

} // namespace vhd
