#include "id_generator.h"
#include <random>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace prism {
namespace utils {

std::string IdGenerator::generateUuid() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;

    std::ostringstream oss;

    // 8-4-4-4-12 hex, version 4 / variant 1
    oss << std::hex << std::setfill('0');
    oss << std::setw(8) << (dis(gen) & 0xFFFFFFFF) << "-";
    oss << std::setw(4) << (dis(gen) & 0xFFFF) << "-";
    oss << std::setw(4) << ((dis(gen) & 0x0FFF) | 0x4000) << "-";
    oss << std::setw(4) << ((dis(gen) & 0x3FFF) | 0x8000) << "-";
    oss << std::setw(12) << (dis(gen) & 0xFFFFFFFFFFFF);

    return oss.str();
}

std::string IdGenerator::generateId(const std::string& prefix) {
    std::ostringstream oss;
    oss << prefix << "_" << std::time(nullptr) << "_" << generateUuid();
    return oss.str();
}

std::string IdGenerator::generateJobId() {
    return generateId("job");
}

std::string IdGenerator::generateImageId() {
    return generateId("img");
}

} // namespace utils
} // namespace prism
