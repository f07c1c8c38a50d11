#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct CatalogueIndexEntry {
    std::string pano_id;
    double latitude;
    double longitude;

    CatalogueIndexEntry() : latitude(0.0), longitude(0.0) {}
    CatalogueIndexEntry(const std::string& id, double lat, double lng) : pano_id(id), latitude(lat), longitude(lng) {}
};

// Writer for the comma-delimited panorama index
class IndexWriter {
public:
    static constexpr const char* kFileName = "index.csv";
    static constexpr char kDelimiter = ',';

    // Creates the file and writes the header. Throws if it cannot be opened.
    explicit IndexWriter(const fs::path& path);

    // Appends one row and flushes it to disk
    void append(const CatalogueIndexEntry& entry);

    size_t row_count() const { return rows; }
    const fs::path& path() const { return file_path; }

private:
    fs::path file_path;
    std::ofstream out_file;
    size_t rows;
};

// Reads an index written by IndexWriter. Throws std::runtime_error when the
// file cannot be opened or the header is not the expected one.
std::vector<CatalogueIndexEntry> read_index(const fs::path& path);
