#pragma once

#include "types.hpp"
#include <memory>
#include <string>

namespace oneamp {

class IFileScanner {
public:
    virtual ~IFileScanner() = default;
    // Recursive, sorted by path. Unreadable subdirectories are skipped.
    virtual TrackList scan_directory(const std::string& directory_path) = 0;
    virtual bool is_supported_format(const std::string& file_path) const = 0;
};

class FileScanner : public IFileScanner {
public:
    TrackList scan_directory(const std::string& directory_path) override;
    bool is_supported_format(const std::string& file_path) const override;

    static PlaylistEntry make_entry(const std::string& file_path);
};

std::unique_ptr<IFileScanner> create_file_scanner();

}
