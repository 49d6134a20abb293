#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>

namespace citerate {

class FileUtils {
public:
    /**
     * @brief Create the directory that will contain filepath, if missing.
     * @throws FileIOException if the directory cannot be created.
     */
    static void ensureParentDirectoryExists(const std::string& filepath);
};

} // namespace citerate

#endif // FILE_UTILS_HPP
