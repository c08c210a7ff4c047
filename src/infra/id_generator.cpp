/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file id_generator.cpp
 * @brief Implementation of the local identifier generator.
 */

#include "hooksync/infra/id_generator.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace hooksync::infra {

/**
 * @brief Generates an RFC 4122 compliant Version 4 UUID.
 *
 * Each worker thread owns its engine (`thread_local`), so concurrent webhook
 * workers never contend on the generator.
 */
std::string IdGenerator::generate(std::string_view prefix)
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    uint64_t p1 = dis(gen);
    uint64_t p2 = dis(gen);

    std::ostringstream ss;
    ss << prefix << std::hex << std::setfill('0')
       << std::setw(8) << static_cast<uint32_t>(p1 >> 32) << "-"
       << std::setw(4) << static_cast<uint16_t>((p1 >> 16) & 0xFFFF) << "-"
       // Version nibble forced to 4.
       << std::setw(4) << ((p1 & 0x0FFF) | 0x4000) << "-"
       // Variant bits forced to 10.
       << std::setw(4) << (((p2 >> 48) & 0x3FFF) | 0x8000) << "-"
       << std::setw(12) << (p2 & 0xFFFFFFFFFFFFULL);

    return ss.str();
}

} // namespace hooksync::infra
