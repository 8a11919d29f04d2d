#pragma once

#include <taskfed/core/time_utils.h>
#include <taskfed/model/task_list.h>

#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace taskfed::tests {

inline std::filesystem::path make_temp_dir(const std::string& prefix = "taskfed_test_") {
    auto base = std::filesystem::temp_directory_path();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" + std::to_string(i));
        if (std::filesystem::create_directories(p))
            return p;
    }
    return base;
}

inline std::filesystem::path write_file(const std::filesystem::path& p, const std::string& data) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
    return p;
}

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

// Sets (or unsets) an environment variable for the lifetime of the guard
class ScopedEnv {
public:
    ScopedEnv(std::string name, const std::optional<std::string>& value) : name_(std::move(name)) {
        if (const char* old = std::getenv(name_.c_str()))
            previous_ = old;
        if (value)
            ::setenv(name_.c_str(), value->c_str(), 1);
        else
            ::unsetenv(name_.c_str());
    }
    ~ScopedEnv() {
        if (previous_)
            ::setenv(name_.c_str(), previous_->c_str(), 1);
        else
            ::unsetenv(name_.c_str());
    }
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::optional<std::string> previous_;
};

/// Fixed reference instant so timestamps in tests are deterministic
inline TimePoint base_time() {
    return time::fromEpochMillis(1714564800000); // 2024-05-01T12:00:00Z
}

inline TimePoint at_minutes(int minutes) {
    return base_time() + std::chrono::minutes(minutes);
}

inline model::Task make_task(const std::string& id,
                             model::TaskStatus status = model::TaskStatus::Pending,
                             model::Priority priority = model::Priority::Medium,
                             std::vector<std::string> tags = {}) {
    model::Task task;
    task.id = id;
    task.title = "Task " + id;
    task.status = status;
    task.priority = priority;
    task.createdAt = base_time();
    task.updatedAt = base_time();
    task.tags = std::move(tags);
    return task;
}

inline model::TaskList make_list(const std::string& id, const std::string& title,
                                 TimePoint updatedAt = base_time(),
                                 const std::string& projectTag = "default") {
    model::TaskList list;
    list.id = id;
    list.title = title;
    list.createdAt = base_time();
    list.updatedAt = updatedAt;
    list.projectTag = projectTag;
    return list;
}

} // namespace taskfed::tests
