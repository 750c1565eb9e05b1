#include "audio_decoder.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace oneamp {

ContainerFormat detect_format(const uint8_t* header, size_t size) {
    if (header == nullptr || size < 4) {
        return ContainerFormat::UNKNOWN;
    }

    // "RIFF....WAVE"
    if (size >= 12 &&
        header[0] == 'R' && header[1] == 'I' && header[2] == 'F' && header[3] == 'F' &&
        header[8] == 'W' && header[9] == 'A' && header[10] == 'V' && header[11] == 'E') {
        return ContainerFormat::WAV;
    }

    if (header[0] == 'f' && header[1] == 'L' && header[2] == 'a' && header[3] == 'C') {
        return ContainerFormat::FLAC;
    }

    if (header[0] == 'O' && header[1] == 'g' && header[2] == 'g' && header[3] == 'S') {
        return ContainerFormat::OGG;
    }

    // ID3v2 tag or MPEG frame sync
    if ((header[0] == 'I' && header[1] == 'D' && header[2] == '3') ||
        (header[0] == 0xFF && (header[1] & 0xE0) == 0xE0)) {
        return ContainerFormat::MP3;
    }

    return ContainerFormat::UNKNOWN;
}

ContainerFormat format_from_extension(const std::string& file_path) {
    std::string extension = std::filesystem::path(file_path).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (extension == ".mp3") {
        return ContainerFormat::MP3;
    } else if (extension == ".wav") {
        return ContainerFormat::WAV;
    } else if (extension == ".flac") {
        return ContainerFormat::FLAC;
    } else if (extension == ".ogg" || extension == ".oga") {
        return ContainerFormat::OGG;
    }

    return ContainerFormat::UNKNOWN;
}

const std::vector<std::string>& supported_extensions() {
    static const std::vector<std::string> extensions = {".mp3", ".wav", ".flac", ".ogg", ".oga"};
    return extensions;
}

bool is_supported_extension(const std::string& file_path) {
    return format_from_extension(file_path) != ContainerFormat::UNKNOWN;
}

AudioError check_readable(const std::string& file_path) {
    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        return AudioError::FILE_NOT_FOUND;
    }
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return AudioError::IO_ERROR;
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return AudioError::IO_ERROR;
    }
    return AudioError::SUCCESS;
}

std::unique_ptr<IAudioDecoder> create_decoder(ContainerFormat format) {
    switch (format) {
        case ContainerFormat::MP3: return std::make_unique<Mp3Decoder>();
        case ContainerFormat::WAV: return std::make_unique<WavDecoder>();
        case ContainerFormat::FLAC: return std::make_unique<FlacDecoder>();
        case ContainerFormat::OGG: return std::make_unique<OggDecoder>();
        default: return nullptr;
    }
}

AudioError open_decoder(const std::string& file_path,
                        std::unique_ptr<IAudioDecoder>& decoder,
                        TrackMetadata& metadata) {
    decoder.reset();

    AudioError readable = check_readable(file_path);
    if (readable != AudioError::SUCCESS) {
        std::cerr << "Decoder: cannot read " << file_path << ": " << describe_error(readable) << "\n";
        return readable;
    }

    uint8_t header[12] = {};
    std::ifstream file(file_path, std::ios::binary);
    file.read(reinterpret_cast<char*>(header), sizeof(header));
    if (file.bad()) {
        return AudioError::IO_ERROR;
    }
    const size_t header_size = static_cast<size_t>(file.gcount());
    file.close();

    ContainerFormat format = detect_format(header, header_size);
    if (format == ContainerFormat::UNKNOWN) {
        // Headerless streams: trust the extension and let the codec decide
        format = format_from_extension(file_path);
    }

    std::unique_ptr<IAudioDecoder> candidate = create_decoder(format);
    if (!candidate) {
        std::cerr << "Decoder: no codec matches " << file_path << "\n";
        return AudioError::UNSUPPORTED_FORMAT;
    }

    AudioError result = candidate->open(file_path, metadata);
    if (result != AudioError::SUCCESS) {
        std::cerr << "Decoder: " << candidate->codec_name() << " open failed for "
                  << file_path << ": " << describe_error(result) << "\n";
        return result;
    }

    std::cout << "Opened " << candidate->codec_name() << ": " << metadata.sample_rate << "Hz, "
              << metadata.channels << " channels, " << metadata.duration << "s\n";

    decoder = std::move(candidate);
    return AudioError::SUCCESS;
}

}
