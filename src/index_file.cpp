#include "index_file.h"

#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {

const char* const kHeader[] = { "pano_id", "latitude", "longitude" };

// Split a line by the delimiter
std::vector<std::string> split_line(const std::string& line, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(line);
    std::string item;

    while (std::getline(ss, item, delimiter)) {
        // Trim whitespace
        item.erase(0, item.find_first_not_of(" \t\r\n"));
        item.erase(item.find_last_not_of(" \t\r\n") + 1);
        result.push_back(item);
    }

    return result;
}

}

IndexWriter::IndexWriter(const fs::path& path) : file_path(path), rows(0) {
    out_file.open(file_path, std::ios::out | std::ios::trunc);
    if (!out_file.is_open()) {
        throw std::runtime_error("Could not open file: " + file_path.string());
    }

    out_file << kHeader[0] << kDelimiter << kHeader[1] << kDelimiter << kHeader[2] << "\n";
    out_file.flush();
}

void IndexWriter::append(const CatalogueIndexEntry& entry) {
    out_file << entry.pano_id << kDelimiter
        << std::setprecision(std::numeric_limits<double>::max_digits10) << entry.latitude << kDelimiter
        << entry.longitude << "\n";
    out_file.flush();

    if (!out_file) {
        throw std::runtime_error("Failed to write index row to " + file_path.string());
    }
    ++rows;
}

std::vector<CatalogueIndexEntry> read_index(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path.string());
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw std::runtime_error("Index file is empty: " + path.string());
    }

    std::vector<std::string> headers = split_line(line, IndexWriter::kDelimiter);
    if (headers.size() != 3 || headers[0] != kHeader[0] || headers[1] != kHeader[1] || headers[2] != kHeader[2]) {
        throw std::runtime_error("Unexpected index header in " + path.string() + ": " + line);
    }

    std::vector<CatalogueIndexEntry> entries;
    while (std::getline(file, line)) {
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        std::vector<std::string> row = split_line(line, IndexWriter::kDelimiter);
        if (row.size() != 3) {
            throw std::runtime_error("Malformed index row in " + path.string() + ": " + line);
        }

        try {
            entries.emplace_back(row[0], std::stod(row[1]), std::stod(row[2]));
        }
        catch (const std::logic_error&) {
            throw std::runtime_error("Malformed coordinates in " + path.string() + ": " + line);
        }
    }

    return entries;
}
