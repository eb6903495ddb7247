#pragma once
#include <string>

namespace Glimpse {
namespace Storage {

class Storage {
public:
    virtual ~Storage() = default;

    // Writes bytes to base_directory/filename and returns that path.
    // Throws PersistenceError.
    virtual std::string persist(const std::string& bytes,
                                const std::string& filename,
                                const std::string& base_directory) = 0;
};

}  // namespace Storage
}  // namespace Glimpse
