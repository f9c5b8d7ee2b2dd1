#include "../../include/random_utils.hpp"
#include <cstdio>
#include <random>

namespace {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<unsigned long long> dist;
}

unsigned long long sqsh::RandomUtils::next_u64() {
    return dist(rng);
}

std::string sqsh::RandomUtils::unique_token() {
    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx", next_u64(), next_u64());
    return {buf, 32};
}
