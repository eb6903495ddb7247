#include "filename.hpp"
#include <algorithm>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include "../../core/types/constants.hpp"

namespace Glimpse {
namespace Utils {

std::string Filename::generate() {
    thread_local boost::uuids::random_generator generator;

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();

    std::string token = boost::uuids::to_string(generator());
    token.erase(std::remove(token.begin(), token.end(), '-'), token.end());

    return std::to_string(millis) + "_" + token + Core::Constants::IMAGE_EXTENSION;
}

}  // namespace Utils
}  // namespace Glimpse
