#include <taskfed/core/format.h>
#include <taskfed/core/time_utils.h>
#include <taskfed/storage/file_backend.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace taskfed::storage {

namespace fs = std::filesystem;

namespace {

bool isListDocument(const fs::path& path) {
    auto name = path.filename().string();
    return path.extension() == ".json" && name.find(".tmp") == std::string::npos &&
           name.find(".backup") == std::string::npos;
}

fs::path withSuffix(const fs::path& path, std::string_view suffix) {
    fs::path out = path;
    out += std::string(suffix);
    return out;
}

} // namespace

FileStorageBackend::FileStorageBackend(Config config) : config_(std::move(config)) {}

boost::asio::awaitable<Result<void>> FileStorageBackend::initialize() {
    std::error_code ec;
    fs::create_directories(listsDirectory(), ec);
    if (!ec) {
        fs::create_directories(backupsDirectory(), ec);
    }
    if (ec) {
        co_return Error{ErrorCode::PermissionDenied,
                        format("Cannot create data directory {}: {}",
                               config_.dataDirectory.string(), ec.message())};
    }

    pruneOldBackups();
    initialized_ = true;
    spdlog::info("[FileStorage] Initialized at {}", config_.dataDirectory.string());
    co_return Result<void>{};
}

boost::asio::awaitable<bool> FileStorageBackend::healthCheck() {
    if (!initialized_) {
        co_return false;
    }
    auto probe = config_.dataDirectory / ".health-check";
    {
        std::ofstream out(probe, std::ios::trunc);
        if (!out) {
            spdlog::warn("[FileStorage] Health probe not writable: {}", probe.string());
            co_return false;
        }
        out << time::toEpochMillis(std::chrono::system_clock::now());
        if (!out) {
            co_return false;
        }
    }
    std::error_code ec;
    fs::remove(probe, ec);
    co_return !ec;
}

Result<fs::path> FileStorageBackend::getListPath(std::string_view key) const {
    if (key.empty() || key.find('/') != std::string_view::npos ||
        key.find('\\') != std::string_view::npos || key.find("..") != std::string_view::npos) {
        return Error{ErrorCode::InvalidArgument, format("Invalid list key '{}'", key)};
    }
    return listsDirectory() / (std::string(key) + ".json");
}

Result<std::optional<model::TaskList>> FileStorageBackend::readList(const fs::path& path) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::optional<model::TaskList>{};
    }

    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::PermissionDenied, format("Cannot open {}", path.string())};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        auto doc = nlohmann::json::parse(buffer.str());
        return std::optional<model::TaskList>(doc.get<model::TaskList>());
    } catch (const std::exception& e) {
        return Error{ErrorCode::CorruptedData,
                     format("Cannot parse {}: {}", path.filename().string(), e.what())};
    }
}

Result<void> FileStorageBackend::writeList(const fs::path& path, const model::TaskList& list,
                                           bool keepBackup) const {
    const auto tempPath = withSuffix(path, ".tmp");
    const auto backupPath = withSuffix(path, ".backup");
    std::error_code ec;

    bool backedUp = false;
    if (keepBackup && fs::exists(path, ec)) {
        fs::copy_file(path, backupPath, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return Error{ErrorCode::WriteError,
                         format("Cannot back up {}: {}", path.filename().string(), ec.message())};
        }
        backedUp = true;
    }

    auto fail = [&](const std::string& message) -> Result<void> {
        std::error_code ignored;
        if (backedUp) {
            fs::rename(backupPath, path, ignored);
            spdlog::debug("[FileStorage] Restored backup of {}", path.filename().string());
        }
        fs::remove(tempPath, ignored);
        return Error{ErrorCode::WriteError, message};
    };

    {
        std::ofstream out(tempPath, std::ios::trunc);
        if (!out) {
            return fail(format("Cannot write {}", tempPath.string()));
        }
        out << nlohmann::json(list).dump(2);
        if (!out) {
            return fail(format("Failed writing {}", tempPath.string()));
        }
    }

    fs::rename(tempPath, path, ec);
    if (ec) {
        return fail(format("Cannot replace {}: {}", path.filename().string(), ec.message()));
    }

    if (backedUp) {
        fs::remove(backupPath, ec);
    }
    return {};
}

boost::asio::awaitable<Result<std::optional<model::TaskList>>>
FileStorageBackend::load(std::string key, LoadOptions options, std::stop_token stop) {
    if (auto c = checkCancelled(stop, "load"); !c) {
        co_return c.error();
    }
    auto path = getListPath(key);
    if (!path) {
        co_return path.error();
    }

    auto list = readList(path.value());
    if (!list) {
        spdlog::error("[FileStorage] {}", list.error().message);
        co_return list;
    }
    if (list.value() && list.value()->isArchived && !options.includeArchived) {
        co_return std::optional<model::TaskList>{};
    }
    co_return list;
}

boost::asio::awaitable<Result<void>> FileStorageBackend::save(std::string key,
                                                              model::TaskList list,
                                                              SaveOptions options,
                                                              std::stop_token stop) {
    if (!initialized_) {
        co_return Error{ErrorCode::NotInitialized, "File storage backend not initialized"};
    }
    if (options.validate) {
        if (auto v = model::validateTaskList(list); !v) {
            co_return v;
        }
    }
    auto path = getListPath(key);
    if (!path) {
        co_return path.error();
    }
    if (auto c = checkCancelled(stop, "save"); !c) {
        co_return c;
    }

    std::lock_guard<std::mutex> lock(writeMutex_);
    auto written = writeList(path.value(), list, options.backup);
    if (!written) {
        spdlog::error("[FileStorage] Save of '{}' failed: {}", key, written.error().message);
        co_return written;
    }
    spdlog::debug("[FileStorage] Saved '{}'", key);
    co_return Result<void>{};
}

boost::asio::awaitable<Result<void>> FileStorageBackend::remove(std::string key, bool permanent,
                                                                std::stop_token stop) {
    if (!initialized_) {
        co_return Error{ErrorCode::NotInitialized, "File storage backend not initialized"};
    }
    auto path = getListPath(key);
    if (!path) {
        co_return path.error();
    }

    std::error_code ec;
    if (!fs::exists(path.value(), ec)) {
        co_return Error{ErrorCode::NotFound, format("Task list not found: {}", key)};
    }
    if (auto c = checkCancelled(stop, "delete"); !c) {
        co_return c;
    }

    std::lock_guard<std::mutex> lock(writeMutex_);
    if (permanent) {
        auto backupPath =
            backupsDirectory() /
            format("{}_deleted_{}.json", key, time::toEpochMillis(std::chrono::system_clock::now()));
        fs::create_directories(backupsDirectory(), ec);
        fs::copy_file(path.value(), backupPath, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            co_return Error{ErrorCode::WriteError,
                            format("Cannot back up '{}' before delete: {}", key, ec.message())};
        }
        fs::remove(path.value(), ec);
        if (ec) {
            co_return Error{ErrorCode::WriteError,
                            format("Cannot delete '{}': {}", key, ec.message())};
        }
        spdlog::info("[FileStorage] Permanently deleted '{}' (backup {})", key,
                     backupPath.filename().string());
        co_return Result<void>{};
    }

    auto current = readList(path.value());
    if (!current) {
        co_return current.error();
    }
    if (!current.value()) {
        co_return Error{ErrorCode::NotFound, format("Task list not found: {}", key)};
    }
    auto archived = std::move(*current.value());
    archived.isArchived = true;
    archived.updatedAt = std::chrono::system_clock::now();
    if (auto w = writeList(path.value(), archived, true); !w) {
        co_return w;
    }
    spdlog::info("[FileStorage] Archived '{}'", key);
    co_return Result<void>{};
}

boost::asio::awaitable<Result<std::vector<model::TaskListSummary>>>
FileStorageBackend::list(ListOptions options, std::stop_token stop) {
    if (!initialized_) {
        co_return Error{ErrorCode::NotInitialized, "File storage backend not initialized"};
    }

    std::vector<model::TaskListSummary> summaries;
    std::error_code ec;
    fs::directory_iterator it(listsDirectory(), ec);
    if (ec) {
        co_return Error{ErrorCode::FileNotFound,
                        format("Cannot read {}: {}", listsDirectory().string(), ec.message())};
    }

    for (const auto& entry : it) {
        if (auto c = checkCancelled(stop, "list"); !c) {
            co_return c.error();
        }
        if (!entry.is_regular_file(ec) || !isListDocument(entry.path())) {
            continue;
        }
        auto list = readList(entry.path());
        if (!list) {
            spdlog::warn("[FileStorage] Skipping unreadable list: {}", list.error().message);
            continue;
        }
        if (!list.value()) {
            continue;
        }
        const auto& tl = *list.value();
        if (tl.isArchived && !options.includeArchived) {
            continue;
        }
        if (options.context && tl.context != *options.context) {
            continue;
        }
        auto summary = model::summarize(tl);
        if (options.projectTag && summary.projectTag != *options.projectTag) {
            continue;
        }
        summaries.push_back(std::move(summary));
    }

    std::stable_sort(summaries.begin(), summaries.end(),
                     [](const model::TaskListSummary& a, const model::TaskListSummary& b) {
                         return a.lastUpdated > b.lastUpdated;
                     });

    size_t offset = std::min(options.offset.value_or(0), summaries.size());
    summaries.erase(summaries.begin(), summaries.begin() + static_cast<std::ptrdiff_t>(offset));
    if (options.limit && *options.limit > 0 && summaries.size() > *options.limit) {
        summaries.resize(*options.limit);
    }
    co_return summaries;
}

boost::asio::awaitable<void> FileStorageBackend::shutdown() {
    initialized_ = false;
    spdlog::info("[FileStorage] Shut down ({})", config_.dataDirectory.string());
    co_return;
}

void FileStorageBackend::pruneOldBackups() const {
    std::error_code ec;
    fs::directory_iterator it(backupsDirectory(), ec);
    if (ec) {
        return;
    }
    const auto cutoff = fs::file_time_type::clock::now() -
                        std::chrono::hours(24) * std::max(config_.backupRetentionDays, 1);
    size_t removed = 0;
    for (const auto& entry : it) {
        auto written = entry.last_write_time(ec);
        if (ec || written >= cutoff) {
            continue;
        }
        if (fs::remove(entry.path(), ec)) {
            ++removed;
        }
    }
    if (removed > 0) {
        spdlog::debug("[FileStorage] Pruned {} old backups", removed);
    }
}

} // namespace taskfed::storage
