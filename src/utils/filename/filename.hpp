#pragma once
#include <string>

namespace Glimpse {
namespace Utils {

class Filename {
public:
    // "<epoch millis>_<uuid hex>.png". Unique across threads and calls.
    static std::string generate();
};

}  // namespace Utils
}  // namespace Glimpse
