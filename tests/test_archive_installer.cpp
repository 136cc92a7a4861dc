#include "migfetch/archive_installer.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

using migfetch::ArchiveInstaller;
using migfetch::ArchiveType;
using migfetch::DistributionTarget;
using migfetch::ErrorKind;
using testutil::ArchiveFileEntry;
using testutil::ArchiveFormat;

std::vector<std::string> ListDir(const std::string& dir) {
    std::vector<std::string> names;
    for (const auto& e : fs::directory_iterator(dir)) {
        names.push_back(e.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool IsExecutable(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return false;
    return (st.st_mode & 0777) == 0755;
}

class ArchiveInstallerTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory out_dir;
    testutil::TemporaryDirectory staging;

    ArchiveInstaller Installer(ArchiveType type = ArchiveType::TarGz) {
        ArchiveInstaller::Options opt;
        opt.archive_type = type;
        opt.staging_base_dir = staging.Path();
        return ArchiveInstaller(opt);
    }

    DistributionTarget Target(const std::string& output, const std::string& binary = "ipfs") {
        return DistributionTarget::Make("go-ipfs", "v0.7.0", "go-ipfs", binary, output, testutil::LinuxAmd64());
    }
};

TEST_F(ArchiveInstallerTests, TargetDefaults) {
    auto t = DistributionTarget::Make("go-ipfs", "v0.7.0", "", "", "/tmp/x", testutil::LinuxAmd64());
    EXPECT_EQ(t.archive_name, "go-ipfs");
    EXPECT_EQ(t.binary_name, "go-ipfs");

    auto w = DistributionTarget::Make("ipfs-10-to-11", "v1.8.0", "", "", "/tmp/x", testutil::WindowsAmd64());
    EXPECT_EQ(w.binary_name, "ipfs-10-to-11.exe");

    auto n = DistributionTarget::Make("go-ipfs", "v0.7.0", "kubo", "", "/tmp/x", testutil::LinuxAmd64());
    EXPECT_EQ(n.archive_name, "kubo");
    EXPECT_EQ(n.binary_name, "kubo");
}

TEST_F(ArchiveInstallerTests, DirectoryOutputGetsBinaryName) {
    auto data = testutil::BuildArchive(ArchiveFormat::TarGz, {
        {"go-ipfs/", "", AE_IFDIR},
        {"go-ipfs/README.md", "readme"},
        {"go-ipfs/ipfs", "#!/bin/sh\necho ipfs\n"},
        {"go-ipfs/install.sh", "install"},
    });
    testutil::MemoryReader reader(data);

    migfetch::InstallResult result;
    auto r = Installer().Install(reader, Target(out_dir.Path()), result);
    ASSERT_TRUE(r.ok) << r.msg;

    const std::string expected = out_dir.Sub("ipfs");
    EXPECT_EQ(result.path, expected);
    EXPECT_EQ(testutil::ReadFile(expected), "#!/bin/sh\necho ipfs\n");
    EXPECT_TRUE(IsExecutable(expected));
    EXPECT_EQ(ListDir(out_dir.Path()), std::vector<std::string>{"ipfs"});
    EXPECT_TRUE(ListDir(staging.Path()).empty());
}

TEST_F(ArchiveInstallerTests, TopLevelEntryIntoDirectory) {
    auto data = testutil::BuildArchive(ArchiveFormat::TarGz, {{"ipfs", "top level"}});
    testutil::MemoryReader reader(data);

    migfetch::InstallResult result;
    auto r = Installer().Install(reader, Target(out_dir.Path()), result);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(result.path, out_dir.Sub("ipfs"));
    EXPECT_TRUE(IsExecutable(result.path));
    EXPECT_EQ(ListDir(out_dir.Path()), std::vector<std::string>{"ipfs"});
}

TEST_F(ArchiveInstallerTests, TopLevelEntryToExplicitPath) {
    auto data = testutil::BuildArchive(ArchiveFormat::TarGz, {{"./ipfs", "binary"}});
    testutil::MemoryReader reader(data);

    const std::string out = out_dir.Sub("my-ipfs");
    migfetch::InstallResult result;
    auto r = Installer().Install(reader, Target(out), result);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(result.path, out);
    EXPECT_EQ(testutil::ReadFile(out), "binary");
    EXPECT_TRUE(IsExecutable(out));
}

TEST_F(ArchiveInstallerTests, ExistingFileIsAlreadyExists) {
    const std::string out = out_dir.Sub("ipfs");
    testutil::WriteFile(out, "keep me");

    auto data = testutil::BuildArchive(ArchiveFormat::TarGz, {{"go-ipfs/ipfs", "new"}});
    testutil::MemoryReader reader(data);

    migfetch::InstallResult result;
    auto r = Installer().Install(reader, Target(out), result);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::AlreadyExists);
    EXPECT_EQ(testutil::ReadFile(out), "keep me");
    EXPECT_TRUE(ListDir(staging.Path()).empty());
}

TEST_F(ArchiveInstallerTests, ResolveOutputPathDisposition) {
    ASSERT_TRUE(fs::create_directory(out_dir.Sub("ipfs")));

    std::string path;
    EXPECT_TRUE(ArchiveInstaller::ResolveOutputPath(out_dir.Path(), "ipfs", path).ok);
    EXPECT_EQ(path, out_dir.Sub("ipfs"));

    testutil::WriteFile(out_dir.Sub("file"), "x");
    auto r = ArchiveInstaller::ResolveOutputPath(out_dir.Sub("file"), "ipfs", path);
    EXPECT_EQ(r.kind, ErrorKind::AlreadyExists);
}

TEST_F(ArchiveInstallerTests, MissingEntryIsExtractErrorAndWritesNothing) {
    auto data = testutil::BuildArchive(ArchiveFormat::TarGz, {
        {"go-ipfs/README.md", "readme"},
        {"other/ipfs", "wrong dir"},
    });
    testutil::MemoryReader reader(data);

    migfetch::InstallResult result;
    auto r = Installer().Install(reader, Target(out_dir.Path()), result);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Extract);
    EXPECT_NE(r.msg.find("ipfs"), std::string::npos);
    EXPECT_TRUE(ListDir(out_dir.Path()).empty());
    EXPECT_TRUE(ListDir(staging.Path()).empty());
}

TEST_F(ArchiveInstallerTests, CorruptArchiveIsExtractError) {
    testutil::MemoryReader reader(std::string("this is not a gzip stream"));

    migfetch::InstallResult result;
    auto r = Installer().Install(reader, Target(out_dir.Path()), result);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Extract);
    EXPECT_TRUE(ListDir(out_dir.Path()).empty());
}

TEST_F(ArchiveInstallerTests, StreamReadFailureIsIoError) {
    testutil::BrokenReader reader;

    migfetch::InstallResult result;
    auto r = Installer().Install(reader, Target(out_dir.Path()), result);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::IO);
    EXPECT_TRUE(ListDir(staging.Path()).empty());
}

TEST_F(ArchiveInstallerTests, ZipArchive) {
    auto data = testutil::BuildArchive(ArchiveFormat::Zip, {
        {"go-ipfs/ipfs.exe", "MZ windows binary"},
        {"go-ipfs/LICENSE", "license"},
    });
    testutil::MemoryReader reader(data);

    auto target = DistributionTarget::Make("go-ipfs", "v0.7.0", "go-ipfs", "ipfs", out_dir.Path(),
                                           testutil::WindowsAmd64());
    migfetch::InstallResult result;
    auto r = Installer(ArchiveType::Zip).Install(reader, target, result);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(result.path, out_dir.Sub("ipfs.exe"));
    EXPECT_EQ(testutil::ReadFile(result.path), "MZ windows binary");
}

TEST_F(ArchiveInstallerTests, CancelledInstallLeavesNothing) {
    auto data = testutil::BuildArchive(ArchiveFormat::TarGz, {{"go-ipfs/ipfs", "bin"}});
    testutil::MemoryReader reader(data);

    migfetch::CancelContext ctx;
    ctx.Cancel();
    ArchiveInstaller::Options opt;
    opt.archive_type = ArchiveType::TarGz;
    opt.staging_base_dir = staging.Path();
    opt.cancel = &ctx;

    migfetch::InstallResult result;
    auto r = ArchiveInstaller(opt).Install(reader, Target(out_dir.Path()), result);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
    EXPECT_TRUE(ListDir(out_dir.Path()).empty());
}

} // namespace
