#pragma once

#include <string>

namespace oneamp {

enum class AudioError {
    SUCCESS = 0,
    FILE_NOT_FOUND = 1,
    IO_ERROR = 2,
    UNSUPPORTED_FORMAT = 3,
    CORRUPT_STREAM = 4,
    DECODE_PACKET_ERROR = 5,
    DEVICE_UNAVAILABLE = 6,
    DEVICE_ERROR = 7,
    SEEK_ERROR = 8
};

enum class DecodeStatus {
    FRAME_READY,
    END_OF_STREAM,
    STREAM_ERROR
};

enum class SeekStatus {
    OK,
    PAST_END,
    FAILED
};

const char* describe_error(AudioError error);

}
