#include "seed.h"

#include <charconv>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {

constexpr uint64_t kMaxCoordinate = std::numeric_limits<uint16_t>::max();

uint16_t json_coordinate(const json& value, size_t entry) {
    if (!value.is_number_unsigned() || value.get<uint64_t>() > kMaxCoordinate) {
        throw std::runtime_error(
            "Invalid seed: entry " + std::to_string(entry) +
            " of \"cells\" has coordinate " + value.dump() +
            " (expected an integer in [0, 65535])");
    }
    return static_cast<uint16_t>(value.get<uint64_t>());
}

CellList parse_json_cells(std::istream& input) {
    json j;
    try {
        j = json::parse(input);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid seed: malformed JSON (") + e.what() + ")");
    }

    if (!j.is_object()) {
        throw std::runtime_error("Invalid seed: document must be an object with a \"cells\" field");
    }
    auto it = j.find("cells");
    if (it == j.end() || !it->is_array()) {
        throw std::runtime_error("Invalid seed: missing \"cells\" array");
    }

    CellList cells;
    cells.reserve(it->size());
    size_t entry = 0;
    for (const json& item : *it) {
        if (!item.is_array() || item.size() != 2) {
            throw std::runtime_error(
                "Invalid seed: entry " + std::to_string(entry) +
                " of \"cells\" is not a [row, col] pair: " + item.dump());
        }
        uint16_t row = json_coordinate(item[0], entry);
        uint16_t col = json_coordinate(item[1], entry);
        cells.push_back({row, col});
        ++entry;
    }
    return cells;
}

const char* skip_blanks(const char* ptr, const char* end) noexcept {
    while (ptr < end && (*ptr == ' ' || *ptr == '\t')) ++ptr;
    return ptr;
}

// Parse one non-negative 16-bit value with std::from_chars (no heap allocation)
const char* parse_life_value(const char* ptr, const char* end, uint16_t& value,
                             const std::string& line) {
    if (ptr < end && *ptr == '-') {
        throw std::runtime_error(
            "Invalid seed: negative coordinate in line '" + line + "'");
    }
    auto [p, ec] = std::from_chars(ptr, end, value);
    if (ec == std::errc::result_out_of_range) {
        throw std::runtime_error(
            "Invalid seed: coordinate out of range [0, 65535] in line '" + line + "'");
    }
    if (ec != std::errc{}) {
        throw std::runtime_error(
            "Invalid seed: malformed coordinate line '" + line + "'");
    }
    return p;
}

CellList parse_life_cells(std::istream& input) {
    CellList cells;
    std::string line;
    bool header_found = false;

    while (std::getline(input, line)) {
        // Trim trailing whitespace in-place
        size_t end = line.find_last_not_of(" \t\r\n");
        if (end == std::string::npos) {
            continue; // Empty line
        }
        line.resize(end + 1);

        // First non-empty line must be the header
        if (!header_found) {
            if (line != "#Life 1.06") {
                throw std::runtime_error(
                    "Invalid seed: missing or invalid Life 1.06 header (expected '#Life 1.06')");
            }
            header_found = true;
            continue;
        }

        const char* const line_end = line.data() + line.size();
        const char* ptr = skip_blanks(line.data(), line_end);

        uint16_t x, y;
        const char* p1 = parse_life_value(ptr, line_end, x, line);

        ptr = skip_blanks(p1, line_end);
        if (ptr == p1) {
            // No whitespace separator found
            throw std::runtime_error(
                "Invalid seed: malformed coordinate line '" + line + "'");
        }

        const char* p2 = parse_life_value(ptr, line_end, y, line);

        // Check for trailing garbage
        if (skip_blanks(p2, line_end) != line_end) {
            throw std::runtime_error(
                "Invalid seed: unexpected content after coordinates '" + line + "'");
        }

        cells.push_back({y, x});
    }

    if (!header_found) {
        throw std::runtime_error("Invalid seed: empty input or missing Life 1.06 header");
    }

    return cells;
}

} // namespace

std::optional<SeedFormat> seed_format_for(std::string_view filename) noexcept {
    size_t dot_pos = filename.rfind('.');
    if (dot_pos == std::string_view::npos) return std::nullopt;
    std::string_view ext = filename.substr(dot_pos);
    if (ext == ".json") return SeedFormat::Json;
    if (ext == ".life" || ext == ".lif") return SeedFormat::Life106;
    return std::nullopt;
}

CellList parse_seed(const std::string& input, SeedFormat format) {
    std::istringstream stream(input);
    return parse_seed(stream, format);
}

CellList parse_seed(std::istream& input, SeedFormat format) {
    switch (format) {
        case SeedFormat::Json:
            return parse_json_cells(input);
        case SeedFormat::Life106:
            return parse_life_cells(input);
    }
    throw std::invalid_argument("Unknown seed format");
}

CellList load_seed_file(const std::string& path) {
    std::optional<SeedFormat> format = seed_format_for(path);
    if (!format) {
        throw std::invalid_argument(
            "Unsupported seed file '" + path + "' (expected .json, .life or .lif)");
    }

    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open seed file '" + path + "'");
    }
    return parse_seed(file, *format);
}
