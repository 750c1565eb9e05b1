#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace oneamp {

// Size of a leading ID3v2 tag including its header, 0 when there is none
size_t id3v2_tag_size(const uint8_t* data, size_t size);

// Copies TIT2/TPE1/TALB text frames into `metadata`. Returns false when the
// buffer does not start with an ID3v2 tag.
bool parse_id3v2(const uint8_t* data, size_t size, TrackMetadata& metadata);

// Reads the 128-byte ID3v1 trailer, filling only fields still "Unknown"
bool parse_id3v1(const uint8_t* data, size_t size, TrackMetadata& metadata);

// Applies a single "KEY=value" Vorbis comment (case-insensitive key)
void apply_vorbis_comment(const std::string& comment, TrackMetadata& metadata);

}
