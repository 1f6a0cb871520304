#include "io/ppm_loader.hpp"
#include "io/ppm_saver.hpp"
#include "codec/raster_codec.hpp"
#include "steg/steg_engine.hpp"
#include "steg/steg_error.hpp"
#include "ppm_fixtures.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>

namespace ppmsteg {
namespace {

namespace fs = std::filesystem;

class PpmFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("ppmsteg_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
    std::string path(const std::string& name) const { return (dir_ / name).string(); }

    fs::path dir_;
};

TEST_F(PpmFileTest, SaveThenLoadKeepsBytesAndSetsId) {
    const auto bytes = test::make_ppm_bytes(7, 5, " ");
    const auto im = parse_ppm(bytes);
    save_ppm(path("cover.ppm"), im);

    EXPECT_EQ(read_file_bytes(path("cover.ppm")), bytes);
    const auto loaded = load_ppm(path("cover.ppm"));
    EXPECT_EQ(loaded.id, "cover.ppm");
    EXPECT_EQ(serialize_ppm(loaded), bytes);
}

TEST_F(PpmFileTest, HiddenMessageSurvivesFiles) {
    save_ppm(path("cover.ppm"), hide_text(parse_ppm(test::make_ppm_bytes(32, 32)), "Hello"));
    EXPECT_EQ(unhide_text(load_ppm(path("cover.ppm"))), "Hello");
}

TEST_F(PpmFileTest, MissingFileIsRuntimeError) {
    EXPECT_THROW(read_file_bytes(path("absent.ppm")), std::runtime_error);
    EXPECT_THROW(load_ppm(path("absent.ppm")), std::runtime_error);
    EXPECT_THROW(read_file_bytes(dir_.string()), std::runtime_error);
}

TEST_F(PpmFileTest, MalformedFileIsFormatErrorNamedAfterFile) {
    write_file_bytes(path("notes.txt"), test::to_bytes("hello, world"));
    try {
        load_ppm(path("notes.txt"));
        FAIL() << "expected StegError";
    } catch (const StegError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Format);
        EXPECT_NE(std::string(e.what()).find("notes.txt"), std::string::npos);
    }
}

TEST_F(PpmFileTest, SaveRejectsBrokenImageWithoutWriting) {
    auto im = parse_ppm(test::make_ppm_bytes(2, 2));
    im.pixel_bytes.resize(5);
    EXPECT_THROW(save_ppm(path("broken.ppm"), im), StegError);
    EXPECT_FALSE(fs::exists(path("broken.ppm")));
}

TEST_F(PpmFileTest, WriteToMissingDirectoryFails) {
    EXPECT_THROW(write_file_bytes(path("no/such/dir/out.ppm"), {1, 2, 3}), std::runtime_error);
}

TEST_F(PpmFileTest, EmptyFileReadsAsEmpty) {
    write_file_bytes(path("empty.bin"), {});
    EXPECT_TRUE(read_file_bytes(path("empty.bin")).empty());
}

} // namespace
} // namespace ppmsteg
