#include "utils/FileUtils.hpp"
#include "exceptions/Exceptions.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace citerate {

void FileUtils::ensureParentDirectoryExists(const std::string& filepath) {
    const fs::path parent = fs::path(filepath).parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw FileIOException("FileUtils::ensureParentDirectoryExists",
                              "Cannot create directory " + parent.string() + ": " + ec.message());
    }
}

} // namespace citerate
