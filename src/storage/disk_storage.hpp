#pragma once
#include <string>
#include "storage.hpp"

namespace Glimpse {
namespace Storage {

class DiskStorage : public Storage {
public:
    DiskStorage()           = default;
    ~DiskStorage() override = default;

    std::string persist(const std::string& bytes,
                        const std::string& filename,
                        const std::string& base_directory) override;
};

}  // namespace Storage
}  // namespace Glimpse
