#include "greetmcp/util/ids.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace greetmcp::util
{

namespace
{
void random_128(uint64_t& high, uint64_t& low)
{
    std::random_device rd;
    std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
    std::uniform_int_distribution<uint64_t> dis;
    high = dis(gen);
    low = dis(gen);
}
} // namespace

std::string generate_session_id()
{
    uint64_t high = 0;
    uint64_t low = 0;
    random_128(high, low);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << high << std::setw(16) << low;
    return oss.str();
}

std::string generate_uuid()
{
    uint64_t high = 0;
    uint64_t low = 0;
    random_128(high, low);

    // version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(8) << (high >> 32) << '-' << std::setw(4)
        << ((high >> 16) & 0xFFFF) << '-' << std::setw(4) << (high & 0xFFFF) << '-'
        << std::setw(4) << (low >> 48) << '-' << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

} // namespace greetmcp::util
