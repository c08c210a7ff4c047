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
 * @file engine.cpp
 * @brief Implementation of the framed journal.
 */

#include "hooksync/storage/engine.hpp"

#include "hooksync/infra/logger.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace hooksync::storage {

namespace {

/// Upper bound on a single record frame. Larger lengths can only come from corruption.
constexpr uint32_t kMaxFrameBytes = 64u * 1024 * 1024;

void write_frame(std::ofstream& file, std::string_view payload)
{
    const uint32_t length = static_cast<uint32_t>(payload.size());
    const uint32_t sum = Engine::checksum(payload);
    file.write(reinterpret_cast<const char*>(&length), sizeof(length));
    file.write(reinterpret_cast<const char*>(&sum), sizeof(sum));
    file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
}

} // namespace

Engine::Engine(std::string base_path) : base_path_(std::move(base_path)) {}

void Engine::init()
{
    if (!fs::exists(base_path_)) {
        fs::create_directories(base_path_);
    }
}

std::string Engine::path_of(const std::string& journal) const
{
    return base_path_ + "/" + journal + ".hsj";
}

uint32_t Engine::checksum(std::string_view data)
{
    uint32_t hash = 2166136261u;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

/**
 * @brief Replays the journal frame by frame.
 *
 * 1. **Header:** length + checksum (8 bytes). A short header ends replay.
 * 2. **Body:** exactly `length` bytes. A short body ends replay.
 * 3. **Verify:** a checksum mismatch ends replay and is reported.
 */
std::vector<std::string> Engine::load(const std::string& journal)
{
    std::vector<std::string> frames;
    const std::string path = path_of(journal);

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return frames;
    }

    uintmax_t valid_bytes = 0;

    while (file.peek() != EOF) {
        uint32_t length = 0;
        uint32_t expected = 0;
        file.read(reinterpret_cast<char*>(&length), sizeof(length));
        file.read(reinterpret_cast<char*>(&expected), sizeof(expected));
        if (!file) {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Engine: Truncated frame header at tail of " + path);
            break;
        }

        if (length > kMaxFrameBytes) {
            infra::Logger::log(infra::LogLevel::ERROR,
                               "Engine: Implausible frame length in " + path + ". Replay stopped.");
            break;
        }

        std::string buffer(length, '\0');
        file.read(&buffer[0], length);
        if (file.gcount() != static_cast<std::streamsize>(length)) {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Engine: Truncated frame body at tail of " + path);
            break;
        }

        if (checksum(buffer) != expected) {
            infra::Logger::log(infra::LogLevel::ERROR, "Engine: Checksum mismatch in " + path +
                                                           " after " +
                                                           std::to_string(frames.size()) +
                                                           " frames. Replay stopped.");
            break;
        }
        valid_bytes += sizeof(length) + sizeof(expected) + length;
        frames.push_back(std::move(buffer));
    }
    file.close();

    truncate_tail(path, valid_bytes);
    return frames;
}

/**
 * @brief Cuts the journal back to its last valid frame.
 *
 * Appends go to the end of the file, so bytes replay cannot read would
 * otherwise hide every frame written after them.
 */
void Engine::truncate_tail(const std::string& path, uintmax_t valid_bytes)
{
    std::error_code ec;
    const uintmax_t size = fs::file_size(path, ec);
    if (ec || size <= valid_bytes)
        return;

    fs::resize_file(path, valid_bytes, ec);
    if (ec) {
        infra::Logger::log(infra::LogLevel::ERROR, "Engine: Could not drop " +
                                                       std::to_string(size - valid_bytes) +
                                                       " unreadable bytes from " + path + ": " +
                                                       ec.message());
        return;
    }
    infra::Logger::log(infra::LogLevel::WARN, "Engine: Dropped " +
                                                  std::to_string(size - valid_bytes) +
                                                  " unreadable bytes from the tail of " + path);
}

/**
 * @brief Appends one frame, or leaves the journal exactly as it was.
 *
 * A failed write may already have put part of the frame on disk. The file is
 * cut back to its previous size; if even that fails, the journal refuses
 * appends until `compact` rewrites it.
 */
bool Engine::append(const std::string& journal, std::string_view payload)
{
    const std::string path = path_of(journal);
    if (damaged_.count(journal)) {
        return false;
    }

    std::error_code ec;
    const uintmax_t size_before = fs::exists(path, ec) ? fs::file_size(path, ec) : 0;
    if (ec) {
        return false;
    }

    std::ofstream file(path, std::ios::binary | std::ios::app);
    if (!file.is_open()) {
        return false;
    }

    write_frame(file, payload);
    file.flush();
    file.close();
    if (!file.fail()) {
        return true;
    }

    fs::resize_file(path, size_before, ec);
    if (ec) {
        damaged_.insert(journal);
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Engine: Partial frame left in " + path + " (" + ec.message() +
                               "). Appends refused until compaction.");
    } else {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Engine: Append to " + path + " failed. Partial frame removed.");
    }
    return false;
}

/**
 * @brief Compaction: write the live set to `<journal>.hsj.tmp`, then rename over
 * the original. A failure at any step leaves the original untouched.
 */
bool Engine::compact(const std::string& journal, const std::vector<std::string>& frames)
{
    const std::string path = path_of(journal);
    const std::string temp_path = path + ".tmp";

    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    for (const auto& frame : frames) {
        write_frame(file, frame);
    }
    file.flush();
    file.close();

    if (file.fail()) {
        std::error_code ec;
        fs::remove(temp_path, ec);
        return false;
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Engine: Compaction rename failed for " + path + ": " + ec.message());
        return false;
    }
    damaged_.erase(journal);
    return true;
}

} // namespace hooksync::storage
