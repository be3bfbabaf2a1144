/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <iomanip>
#include <numeric>
#include <random>
#include <sstream>

namespace kcenon::media_relay::benchmark {

namespace {

auto make_engine(uint32_t seed) -> std::mt19937 {
    return std::mt19937(seed == 0 ? std::random_device{}() : seed);
}

}  // namespace

// ============================================================================
// Generated inputs
// ============================================================================

auto random_bytes(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    auto engine = make_engine(seed);
    std::uniform_int_distribution<unsigned> octet(0, 255);

    std::vector<std::byte> data(size);
    std::generate(data.begin(), data.end(),
                  [&] { return static_cast<std::byte>(octet(engine)); });
    return data;
}

auto make_catalog_document(std::size_t count, uint32_t seed) -> std::string {
    static constexpr std::array<const char*, 14> pantry = {
        "rice", "noodles", "beef", "chicken", "garlic", "ginger", "basil",
        "lime", "chili", "onion", "tomato", "egg", "flour", "butter"};

    auto engine = make_engine(seed);
    std::uniform_int_distribution<std::size_t> pick(0, pantry.size() - 1);

    std::vector<std::size_t> ids(count);
    std::iota(ids.begin(), ids.end(), std::size_t{1});
    std::shuffle(ids.begin(), ids.end(), engine);

    std::ostringstream doc;
    doc << "{\"recipes\": [";
    const char* separator = "\n  ";
    for (auto id : ids) {
        doc << separator << "{\"id\": " << id
            << ", \"dish_name\": \"Dish " << id << "\""
            << ", \"public_url\": \"https://drive.google.com/file/d/F" << id << "/view\""
            << ", \"ingredients\": [";
        for (int i = 0; i < 3; ++i) {
            doc << (i == 0 ? "" : ", ") << "\"" << pantry[pick(engine)] << "\"";
        }
        doc << "]}";
        separator = ",\n  ";
    }
    doc << "\n]}\n";
    return doc.str();
}

auto make_ledger_document(std::size_t count) -> std::string {
    std::string doc = "[";
    for (std::size_t id = 1; id <= count; ++id) {
        if (id > 1) {
            doc += ", ";
        }
        doc += "\"" + std::to_string(id) + "\"";
    }
    return doc + "]";
}

// ============================================================================
// relay_workspace
// ============================================================================

relay_workspace::relay_workspace()
    : root_(std::filesystem::temp_directory_path() /
            ("media_relay_bench_" + std::to_string(std::random_device{}()))) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
}

relay_workspace::~relay_workspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
}

auto relay_workspace::prepare(const std::filesystem::path& relative) const
    -> std::filesystem::path {
    auto path = root_ / relative;
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    return path;
}

auto relay_workspace::write_bytes(const std::filesystem::path& relative,
                                  const std::vector<std::byte>& data)
    -> std::filesystem::path {
    auto path = prepare(relative);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    return path;
}

auto relay_workspace::write_text(const std::filesystem::path& relative, const std::string& text)
    -> std::filesystem::path {
    auto path = prepare(relative);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
    return path;
}

auto relay_workspace::write_random(const std::filesystem::path& relative, std::size_t size,
                                   uint32_t seed) -> std::filesystem::path {
    return write_bytes(relative, random_bytes(size, seed));
}

// ============================================================================
// Formatting
// ============================================================================

auto format_bytes(uint64_t bytes) -> std::string {
    static constexpr std::array<const char*, 4> units = {"B", "KB", "MB", "GB"};

    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    }
    return oss.str();
}

}  // namespace kcenon::media_relay::benchmark
