#include "../../include/random_utils.hpp"
#include <random>
#include <sstream>

namespace {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<unsigned long long> dist;
}

unsigned long long RandomUtils::next_u64() {
    return dist(rng);
}

std::string RandomUtils::random_suffix() {
    std::ostringstream oss;
    oss << std::hex << next_u64();
    return oss.str();
}
