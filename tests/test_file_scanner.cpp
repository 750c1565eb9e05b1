#include <gtest/gtest.h>
#include "file_scanner.hpp"
#include "wav_fixture.hpp"
#include <algorithm>
#include <fstream>

class FileScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        scanner = oneamp::create_file_scanner();
        test_dir = oneamp_test::make_temp_dir("scanner");

        create_test_file(test_dir / "b_song.mp3");
        create_test_file(test_dir / "a_song.wav");
        create_test_file(test_dir / "not_audio.txt");
        create_test_file(test_dir / "LOUD.FLAC");
        std::filesystem::create_directories(test_dir / "album");
        create_test_file(test_dir / "album" / "01_intro.ogg");
        create_test_file(test_dir / "album" / "cover.jpg");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir, ec);
    }

    void create_test_file(const std::filesystem::path& path) {
        std::ofstream file(path);
        file << "dummy content";
    }

    std::unique_ptr<oneamp::IFileScanner> scanner;
    std::filesystem::path test_dir;
};

TEST_F(FileScannerTest, SupportedFormats) {
    EXPECT_TRUE(scanner->is_supported_format("test.mp3"));
    EXPECT_TRUE(scanner->is_supported_format("test.MP3"));
    EXPECT_TRUE(scanner->is_supported_format("test.wav"));
    EXPECT_TRUE(scanner->is_supported_format("test.flac"));
    EXPECT_TRUE(scanner->is_supported_format("test.ogg"));

    EXPECT_FALSE(scanner->is_supported_format("test.txt"));
    EXPECT_FALSE(scanner->is_supported_format("test.doc"));
    EXPECT_FALSE(scanner->is_supported_format("test"));
}

TEST_F(FileScannerTest, ScanIsRecursiveAndSorted) {
    auto entries = scanner->scan_directory(test_dir.string());
    ASSERT_EQ(entries.size(), 4u);

    std::vector<std::string> names;
    for (const auto& entry : entries) {
        names.push_back(std::filesystem::path(entry.file_path).filename().string());
    }
    EXPECT_TRUE(std::is_sorted(entries.begin(), entries.end(),
                               [](const oneamp::PlaylistEntry& a, const oneamp::PlaylistEntry& b) {
                                   return a.file_path < b.file_path;
                               }));
    EXPECT_NE(std::find(names.begin(), names.end(), "01_intro.ogg"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "LOUD.FLAC"), names.end());
    EXPECT_EQ(std::find(names.begin(), names.end(), "not_audio.txt"), names.end());
    EXPECT_EQ(std::find(names.begin(), names.end(), "cover.jpg"), names.end());
}

TEST_F(FileScannerTest, DisplayNameComesFromFileName) {
    auto entry = oneamp::FileScanner::make_entry("/music/artist/my_best_song.flac");
    EXPECT_EQ(entry.file_path, "/music/artist/my_best_song.flac");
    EXPECT_EQ(entry.display_name, "my best song");
}

TEST_F(FileScannerTest, MissingDirectoryGivesEmptyList) {
    auto entries = scanner->scan_directory((test_dir / "nope").string());
    EXPECT_TRUE(entries.empty());
}

TEST_F(FileScannerTest, EmptyDirectoryGivesEmptyList) {
    std::filesystem::create_directories(test_dir / "empty");
    EXPECT_TRUE(scanner->scan_directory((test_dir / "empty").string()).empty());
}
