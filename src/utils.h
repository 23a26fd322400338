#pragma once
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace blm {

using json = nlohmann::json;

// Returns current time in milliseconds (monotonic clock)
static inline long long NowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
               steady_clock::now().time_since_epoch()
           ).count();
}

static inline json load_json(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open file: " + path);
    json j; in >> j; return j;
}

static inline void save_json(const std::string& path, const json& j) {
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
    std::ofstream out(path);
    if (!out) throw std::runtime_error("Cannot write file: " + path);
    out << std::setw(2) << j << "\n";
}

} // namespace blm
