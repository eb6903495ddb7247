#include "disk_storage.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>
#include "../core/logger/logger.hpp"
#include "glimpse/errors.hpp"

namespace Glimpse {
namespace Storage {

using namespace Glimpse::Core;

std::string DiskStorage::persist(const std::string& bytes,
                                 const std::string& filename,
                                 const std::string& base_directory) {
    if (base_directory.empty())
        throw PersistenceError("Storage directory is not set");
    if (filename.empty() || filename.find('/') != std::string::npos)
        throw PersistenceError("Invalid screenshot filename: '" + filename + "'");

    std::error_code ec;
    std::filesystem::create_directories(base_directory, ec);
    if (ec)
        throw PersistenceError("Failed to create storage directory " + base_directory + ": "
                               + ec.message());

    // Callers hand this string to clients, so build it verbatim.
    std::string path = base_directory + "/" + filename;

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
        throw PersistenceError("Write Error: " + path);

    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (file.fail())
        throw PersistenceError("Write Error (incomplete): " + path);

    Logger::success("Saved: " + path);
    return path;
}

}  // namespace Storage
}  // namespace Glimpse
