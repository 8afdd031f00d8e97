#include "usync/sync/scanner.hpp"

#include "usync/core/hash.hpp"
#include "usync/core/thread_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <future>
#include <system_error>

namespace fs = std::filesystem;

namespace usync::sync {
namespace {

std::int64_t to_unix_seconds(fs::file_time_type time) {
    using namespace std::chrono;
    const auto system_time = time_point_cast<system_clock::duration>(
        time - fs::file_time_type::clock::now() + system_clock::now());
    return duration_cast<seconds>(system_time.time_since_epoch()).count();
}

bool is_hidden(const fs::path& path) {
    const auto name = path.filename().string();
    return !name.empty() && name.front() == '.';
}

} // namespace

FolderScanner::FolderScanner(std::uint32_t segment_size, bool skip_hidden, std::size_t threads)
    : segment_size_(segment_size), skip_hidden_(skip_hidden), threads_(threads == 0 ? 1 : threads) {}

Result<ScanResult> FolderScanner::scan(const fs::path& root) const {
    if (segment_size_ == 0) {
        return Err<ScanResult>(ErrorCode::Validation, "Segment size must be positive");
    }
    std::error_code ec;
    if (root.empty() || !fs::is_directory(root, ec)) {
        return Err<ScanResult>(ErrorCode::Io, "Not a directory: " + root.string());
    }

    std::vector<std::pair<fs::path, std::string>> candidates;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Err<ScanResult>(ErrorCode::Io, "Cannot walk " + root.string() + ": " + ec.message());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return Err<ScanResult>(ErrorCode::Io, "Walk failed under " + root.string() + ": " + ec.message());
        }
        const auto& entry = *it;
        if (skip_hidden_ && is_hidden(entry.path())) {
            if (entry.is_directory(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        auto relative = fs::relative(entry.path(), root, ec);
        if (ec || relative.empty()) {
            continue;
        }
        candidates.emplace_back(entry.path(), relative.generic_string());
    }

    ThreadPool pool(std::min(threads_, std::max<std::size_t>(candidates.size(), 1)));
    std::vector<std::future<Result<ScannedFile>>> pending;
    pending.reserve(candidates.size());
    const auto segment_size = segment_size_;
    for (const auto& [absolute, relative] : candidates) {
        pending.push_back(pool.submit([absolute = absolute, relative = relative, segment_size]() {
            return hash_file(absolute, relative, segment_size);
        }));
    }

    ScanResult result;
    result.files.reserve(pending.size());
    for (auto& future : pending) {
        auto file = future.get();
        if (file.is_error()) {
            return Err<ScanResult>(file.error());
        }
        result.total_size += file.value().size;
        result.files.push_back(std::move(file.value()));
    }
    std::sort(result.files.begin(), result.files.end(),
              [](const ScannedFile& lhs, const ScannedFile& rhs) { return lhs.path < rhs.path; });

    spdlog::debug("Scanned {}: {} files, {} bytes", root.string(), result.files.size(), result.total_size);
    return Ok(std::move(result));
}

Result<ScannedFile> FolderScanner::hash_file(const fs::path& absolute_path,
                                             const std::string& relative_path,
                                             std::uint32_t segment_size) {
    std::error_code ec;
    ScannedFile file;
    file.path = relative_path;
    file.size = fs::file_size(absolute_path, ec);
    if (ec) {
        return Err<ScannedFile>(ErrorCode::Io, "Cannot stat " + absolute_path.string() + ": " + ec.message());
    }
    auto write_time = fs::last_write_time(absolute_path, ec);
    if (ec) {
        return Err<ScannedFile>(ErrorCode::Io, "Cannot stat " + absolute_path.string() + ": " + ec.message());
    }
    file.modified_time = to_unix_seconds(write_time);

    std::ifstream in(absolute_path, std::ios::binary);
    if (!in) {
        return Err<ScannedFile>(ErrorCode::Io, "Cannot open " + absolute_path.string());
    }

    hash::Sha256 whole;
    std::vector<char> buffer(segment_size);
    std::uint64_t offset = 0;
    std::uint32_t index = 0;
    while (offset < file.size) {
        const auto want = static_cast<std::streamsize>(
            std::min<std::uint64_t>(segment_size, file.size - offset));
        in.read(buffer.data(), want);
        if (in.gcount() != want) {
            return Err<ScannedFile>(ErrorCode::Io, "File changed while hashing: " + absolute_path.string());
        }
        whole.update(buffer.data(), static_cast<std::size_t>(want));

        ScannedSegment segment;
        segment.index = index++;
        segment.offset = offset;
        segment.size = static_cast<std::uint32_t>(want);
        segment.hash = hash::sha256_hex(buffer.data(), static_cast<std::size_t>(want));
        file.segments.push_back(std::move(segment));
        offset += static_cast<std::uint64_t>(want);
    }
    file.hash = whole.finish_hex();
    return Ok(std::move(file));
}

} // namespace usync::sync
