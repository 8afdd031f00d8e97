#include "usync/sync/segment_io.hpp"

#include "usync/core/hash.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace usync::sync {
namespace fs = std::filesystem;

namespace {

Result<std::string> hash_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorCode::Io, "Failed to open " + path.string());
    }
    hash::Sha256 digest;
    char buffer[65536];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        digest.update(buffer, static_cast<std::size_t>(input.gcount()));
    }
    return Ok(digest.finish_hex());
}

} // namespace

Result<std::vector<std::uint8_t>> SegmentIo::read_segment(const fs::path& source,
                                                          std::uint64_t offset,
                                                          std::uint32_t size,
                                                          const std::string& expected_hash) const {
    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::Io, "Failed to open source file: " + source.string());
    }
    input.seekg(static_cast<std::streamoff>(offset));

    std::vector<std::uint8_t> data(size);
    input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
    if (static_cast<std::uint64_t>(input.gcount()) != size) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::Integrity,
                                              "Source shrank since indexing: " + source.string());
    }
    if (hash::sha256_hex(data.data(), data.size()) != expected_hash) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::Integrity,
                                              "Source changed since indexing: " + source.string() +
                                              " at offset " + std::to_string(offset));
    }
    return Ok(std::move(data));
}

Result<void> SegmentIo::apply_segment(const std::string& session_id,
                                      const std::string& file_path,
                                      std::uint64_t offset,
                                      const std::vector<std::uint8_t>& data,
                                      const std::string& expected_hash,
                                      const fs::path& staging_root) const {
    if (auto valid = check_relative(file_path); valid.is_error()) {
        return valid;
    }
    if (hash::sha256_hex(data.data(), data.size()) != expected_hash) {
        return Err<void>(ErrorCode::Integrity, "Segment hash mismatch for " + file_path +
                                               " at offset " + std::to_string(offset));
    }

    const auto staging_path = make_staging_path(staging_root, session_id, file_path);
    if (auto res = ensure_parent_exists(staging_path); res.is_error()) {
        return res;
    }

    std::fstream file(staging_path, std::ios::in | std::ios::out | std::ios::binary);
    if (!file) {
        // Append mode creates the file without truncating bytes another worker already wrote
        std::ofstream create(staging_path, std::ios::binary | std::ios::app);
        if (!create) {
            return Err<void>(ErrorCode::Io, "Failed to create staging file: " + staging_path.string());
        }
        create.close();
        file.open(staging_path, std::ios::in | std::ios::out | std::ios::binary);
    }
    if (!file) {
        return Err<void>(ErrorCode::Io, "Failed to open staging file: " + staging_path.string());
    }

    file.seekp(static_cast<std::streamoff>(offset));
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
        return Err<void>(ErrorCode::Io, "Failed to write segment for " + file_path);
    }
    return Ok();
}

Result<void> SegmentIo::finalize_file(const std::string& session_id,
                                      const std::string& file_path,
                                      std::uint64_t expected_size,
                                      const std::string& expected_hash,
                                      const fs::path& staging_root,
                                      const fs::path& destination_root) const {
    if (auto valid = check_relative(file_path); valid.is_error()) {
        return valid;
    }
    const auto staging_path = make_staging_path(staging_root, session_id, file_path);

    std::error_code ec;
    if (expected_size == 0 && !fs::exists(staging_path, ec)) {
        // Empty files have no segments, so nothing was staged
        if (auto res = ensure_parent_exists(staging_path); res.is_error()) {
            return res;
        }
        std::ofstream create(staging_path, std::ios::binary | std::ios::trunc);
        if (!create) {
            return Err<void>(ErrorCode::Io, "Failed to create staging file: " + staging_path.string());
        }
    }
    if (!fs::exists(staging_path, ec)) {
        return Err<void>(ErrorCode::NotFound, "Staging file missing: " + staging_path.string());
    }

    const auto staged_size = fs::file_size(staging_path, ec);
    if (ec || staged_size != expected_size) {
        return Err<void>(ErrorCode::Integrity,
                         "Staged size " + std::to_string(staged_size) + " differs from " +
                         std::to_string(expected_size) + " for " + file_path);
    }
    auto digest = hash_file(staging_path);
    if (digest.is_error()) {
        return Err<void>(digest.error());
    }
    if (digest.value() != expected_hash) {
        return Err<void>(ErrorCode::Integrity, "Final hash mismatch for " + file_path);
    }

    const fs::path destination_path = destination_root / fs::path(file_path);
    if (auto res = ensure_parent_exists(destination_path); res.is_error()) {
        return res;
    }
    fs::rename(staging_path, destination_path, ec);
    if (ec) {
        return Err<void>(ErrorCode::Io, "Failed to move staging file to " + destination_path.string() +
                                         ": " + ec.message());
    }
    spdlog::debug("Finalized {} ({} bytes)", destination_path.string(), expected_size);
    return Ok();
}

Result<bool> SegmentIo::file_matches(const fs::path& path,
                                     std::uint64_t expected_size,
                                     const std::string& expected_hash) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Ok(false);
    }
    const auto size = fs::file_size(path, ec);
    if (ec || size != expected_size) {
        return Ok(false);
    }
    auto actual = hash_file(path);
    if (actual.is_error()) {
        return Err<bool>(actual.error());
    }
    return Ok(actual.value() == expected_hash);
}

Result<void> SegmentIo::discard_staging(const std::string& session_id, const fs::path& staging_root) const {
    std::error_code ec;
    fs::remove_all(staging_root / session_id, ec);
    if (ec) {
        return Err<void>(ErrorCode::Io, "Failed to remove staging for " + session_id + ": " + ec.message());
    }
    return Ok();
}

fs::path SegmentIo::make_staging_path(const fs::path& staging_root,
                                      const std::string& session_id,
                                      const std::string& file_path) {
    return staging_root / session_id / fs::path(file_path).relative_path();
}

Result<void> SegmentIo::check_relative(const std::string& file_path) {
    const fs::path path(file_path);
    if (file_path.empty() || path.is_absolute()) {
        return Err<void>(ErrorCode::Validation, "File path must be relative: " + file_path);
    }
    for (const auto& part : path) {
        if (part == "..") {
            return Err<void>(ErrorCode::Validation, "File path escapes its root: " + file_path);
        }
    }
    return Ok();
}

Result<void> SegmentIo::ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err<void>(ErrorCode::Io, "Failed to create directory: " + parent.string());
    }
    return Ok();
}

} // namespace usync::sync
