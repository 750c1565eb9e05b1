#include "tag_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace oneamp {

namespace {

const char* const UNKNOWN_FIELD = "Unknown";

void append_utf8(std::string& out, uint32_t code_point) {
    if (code_point < 0x80) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && (std::isspace(static_cast<unsigned char>(text[begin])) || text[begin] == '\0')) {
        ++begin;
    }
    while (end > begin && (std::isspace(static_cast<unsigned char>(text[end - 1])) || text[end - 1] == '\0')) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string latin1_to_utf8(const uint8_t* data, size_t size) {
    std::string out;
    for (size_t i = 0; i < size && data[i] != 0; ++i) {
        append_utf8(out, data[i]);
    }
    return out;
}

std::string utf16_to_utf8(const uint8_t* data, size_t size, bool big_endian) {
    std::string out;
    size_t i = 0;

    if (size >= 2) {
        if (data[0] == 0xFF && data[1] == 0xFE) {
            big_endian = false;
            i = 2;
        } else if (data[0] == 0xFE && data[1] == 0xFF) {
            big_endian = true;
            i = 2;
        }
    }

    auto unit_at = [&](size_t pos) -> uint32_t {
        return big_endian ? (static_cast<uint32_t>(data[pos]) << 8) | data[pos + 1]
                          : (static_cast<uint32_t>(data[pos + 1]) << 8) | data[pos];
    };

    while (i + 1 < size) {
        uint32_t unit = unit_at(i);
        i += 2;
        if (unit == 0) {
            break;
        }
        if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < size) {
            uint32_t low = unit_at(i);
            if (low >= 0xDC00 && low <= 0xDFFF) {
                i += 2;
                unit = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
            }
        }
        append_utf8(out, unit);
    }
    return out;
}

std::string decode_text_frame(const uint8_t* data, size_t size) {
    if (size < 1) {
        return {};
    }
    const uint8_t encoding = data[0];
    const uint8_t* text = data + 1;
    const size_t text_size = size - 1;

    switch (encoding) {
        case 0: return trim(latin1_to_utf8(text, text_size));
        case 1: return trim(utf16_to_utf8(text, text_size, false));
        case 2: return trim(utf16_to_utf8(text, text_size, true));
        case 3: return trim(std::string(reinterpret_cast<const char*>(text), text_size));
        default: return {};
    }
}

uint32_t read_syncsafe(const uint8_t* bytes) {
    return (static_cast<uint32_t>(bytes[0] & 0x7F) << 21) |
           (static_cast<uint32_t>(bytes[1] & 0x7F) << 14) |
           (static_cast<uint32_t>(bytes[2] & 0x7F) << 7) |
           static_cast<uint32_t>(bytes[3] & 0x7F);
}

uint32_t read_be32(const uint8_t* bytes) {
    return (static_cast<uint32_t>(bytes[0]) << 24) | (static_cast<uint32_t>(bytes[1]) << 16) |
           (static_cast<uint32_t>(bytes[2]) << 8) | static_cast<uint32_t>(bytes[3]);
}

void assign_if_present(std::string& field, const std::string& value) {
    if (!value.empty()) {
        field = value;
    }
}

}

size_t id3v2_tag_size(const uint8_t* data, size_t size) {
    if (data == nullptr || size < 10 || std::memcmp(data, "ID3", 3) != 0) {
        return 0;
    }
    size_t tag_size = 10 + read_syncsafe(data + 6);
    if (data[5] & 0x10) {
        tag_size += 10;  // footer
    }
    return tag_size;
}

bool parse_id3v2(const uint8_t* data, size_t size, TrackMetadata& metadata) {
    const size_t tag_size = id3v2_tag_size(data, size);
    if (tag_size == 0) {
        return false;
    }

    const uint8_t major_version = data[3];
    const size_t end = std::min(tag_size, size);
    size_t pos = 10;

    // Extended header
    if (data[5] & 0x40 && pos + 4 <= end) {
        const uint32_t extended = major_version >= 4 ? read_syncsafe(data + pos) : read_be32(data + pos) + 4;
        pos += extended;
    }

    if (major_version < 3) {
        // ID3v2.2: 3-byte ids and sizes
        while (pos + 6 <= end && data[pos] != 0) {
            const std::string id(reinterpret_cast<const char*>(data + pos), 3);
            const size_t frame_size = (static_cast<size_t>(data[pos + 3]) << 16) |
                                      (static_cast<size_t>(data[pos + 4]) << 8) | data[pos + 5];
            pos += 6;
            if (frame_size == 0 || pos + frame_size > end) {
                break;
            }
            if (id == "TT2") {
                assign_if_present(metadata.title, decode_text_frame(data + pos, frame_size));
            } else if (id == "TP1") {
                assign_if_present(metadata.artist, decode_text_frame(data + pos, frame_size));
            } else if (id == "TAL") {
                assign_if_present(metadata.album, decode_text_frame(data + pos, frame_size));
            }
            pos += frame_size;
        }
        return true;
    }

    while (pos + 10 <= end && data[pos] != 0) {
        const std::string id(reinterpret_cast<const char*>(data + pos), 4);
        const size_t frame_size = major_version >= 4 ? read_syncsafe(data + pos + 4) : read_be32(data + pos + 4);
        pos += 10;
        if (frame_size == 0 || pos + frame_size > end) {
            break;
        }
        if (id == "TIT2") {
            assign_if_present(metadata.title, decode_text_frame(data + pos, frame_size));
        } else if (id == "TPE1") {
            assign_if_present(metadata.artist, decode_text_frame(data + pos, frame_size));
        } else if (id == "TALB") {
            assign_if_present(metadata.album, decode_text_frame(data + pos, frame_size));
        }
        pos += frame_size;
    }
    return true;
}

bool parse_id3v1(const uint8_t* data, size_t size, TrackMetadata& metadata) {
    if (data == nullptr || size < 128) {
        return false;
    }
    const uint8_t* tag = data + size - 128;
    if (std::memcmp(tag, "TAG", 3) != 0) {
        return false;
    }

    auto fill = [](std::string& field, const uint8_t* text, size_t length) {
        if (field != UNKNOWN_FIELD) {
            return;
        }
        assign_if_present(field, trim(latin1_to_utf8(text, length)));
    };

    fill(metadata.title, tag + 3, 30);
    fill(metadata.artist, tag + 33, 30);
    fill(metadata.album, tag + 63, 30);
    return true;
}

void apply_vorbis_comment(const std::string& comment, TrackMetadata& metadata) {
    const size_t separator = comment.find('=');
    if (separator == std::string::npos || separator == 0) {
        return;
    }

    std::string key = comment.substr(0, separator);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    const std::string value = trim(comment.substr(separator + 1));

    if (key == "TITLE") {
        assign_if_present(metadata.title, value);
    } else if (key == "ARTIST") {
        assign_if_present(metadata.artist, value);
    } else if (key == "ALBUM") {
        assign_if_present(metadata.album, value);
    }
}

}
