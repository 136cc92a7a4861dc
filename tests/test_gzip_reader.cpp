#include "io/gzip_reader.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace migfetch {

namespace {

// echo -n "hello" | gzip -c | xxd -i
const std::vector<std::uint8_t> kHelloGz = {0x1f, 0x8b, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                                            0x03, 0xcb, 0x48, 0xcd, 0xc9, 0xc9, 0x07, 0x00, 0x86,
                                            0xa6, 0x10, 0x36, 0x05, 0x00, 0x00, 0x00};

} // namespace

TEST(GzipReaderTest, SuccessfullyDecompressesGzipData) {
    GzipReader gz_reader(std::make_unique<testutil::MemoryReader>(kHelloGz));

    std::vector<uint8_t> output_buffer(64, 0);
    ssize_t n = gz_reader.Read(output_buffer);

    ASSERT_GT(n, 0);
    std::string decompressed(reinterpret_cast<char*>(output_buffer.data()), n);
    EXPECT_EQ(decompressed, "hello");
    EXPECT_EQ(gz_reader.Read(output_buffer), 0);
}

TEST(GzipReaderTest, HandlesInvalidGzipHeader) {
    std::vector<uint8_t> garbage = {0x00, 0x01, 0x02, 0x03};
    GzipReader gz_reader(std::make_unique<testutil::MemoryReader>(garbage));

    std::vector<uint8_t> output_buffer(64);
    EXPECT_LT(gz_reader.Read(output_buffer), 0);
}

TEST(GzipReaderTest, TruncatedStreamIsError) {
    std::vector<uint8_t> truncated(kHelloGz.begin(), kHelloGz.begin() + 10);
    GzipReader gz_reader(std::make_unique<testutil::MemoryReader>(truncated));

    std::vector<uint8_t> output_buffer(64);
    EXPECT_LT(gz_reader.Read(output_buffer), 0);
}

TEST(GzipReaderTest, DecompressesTarGzFixture) {
    auto tgz = testutil::BuildArchive(testutil::ArchiveFormat::TarGz, {{"dist/bin", std::string(100000, 'x')}});
    GzipReader gz_reader(std::make_unique<testutil::MemoryReader>(tgz));

    const std::string tar = testutil::ReadAll(gz_reader);
    // 512-byte header, 100000 bytes of data padded to a block, plus the end marker
    ASSERT_GE(tar.size(), 512u + 100000u);
    EXPECT_EQ(tar.size() % 512, 0u);
    EXPECT_NE(tar.find(std::string(1000, 'x')), std::string::npos);
}

} // namespace migfetch
