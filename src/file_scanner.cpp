#include "file_scanner.hpp"
#include "audio_decoder.hpp"
#include <filesystem>
#include <algorithm>
#include <iostream>

namespace oneamp {

TrackList FileScanner::scan_directory(const std::string& directory_path) {
    TrackList entries;

    std::error_code ec;
    auto it = std::filesystem::recursive_directory_iterator(
        directory_path, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "Scanner: cannot open " << directory_path << ": " << ec.message() << "\n";
        return entries;
    }

    for (const auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            std::cerr << "Scanner: skipping entry under " << directory_path << ": " << ec.message() << "\n";
            ec.clear();
            continue;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && is_supported_format(it->path().string())) {
            entries.push_back(make_entry(it->path().string()));
        }
    }

    std::sort(entries.begin(), entries.end(),
              [](const PlaylistEntry& a, const PlaylistEntry& b) {
                  return a.file_path < b.file_path;
              });

    return entries;
}

bool FileScanner::is_supported_format(const std::string& file_path) const {
    return is_supported_extension(file_path);
}

PlaylistEntry FileScanner::make_entry(const std::string& file_path) {
    PlaylistEntry entry;
    entry.file_path = file_path;

    std::string name = std::filesystem::path(file_path).stem().string();
    std::replace(name.begin(), name.end(), '_', ' ');
    entry.display_name = name.empty() ? "Unknown" : name;
    return entry;
}

std::unique_ptr<IFileScanner> create_file_scanner() {
    return std::make_unique<FileScanner>();
}

}
