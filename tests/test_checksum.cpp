#include <stdexcept>

#include <gtest/gtest.h>

#include "bulkdl/checksum.hpp"
#include "test_util.hpp"

using namespace bulkdl;
using bulkdl::fake::TempDir;
using bulkdl::fake::writeFile;

namespace
{

const char *kHelloSha256 = "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
const char *kEmptySha256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

} // namespace

TEST(ChecksumTest, ComputesSha256OfFile)
{
    TempDir tmp;
    writeFile(tmp / "hello.txt", "hello");
    writeFile(tmp / "empty.txt", "");

    EXPECT_EQ(ChecksumVerifier::computeSHA256(tmp / "hello.txt"), kHelloSha256);
    EXPECT_EQ(ChecksumVerifier::computeSHA256(tmp / "empty.txt"), kEmptySha256);
}

TEST(ChecksumTest, VerifyAcceptsMatchingDigestAndRejectsOthers)
{
    TempDir tmp;
    writeFile(tmp / "hello.txt", "hello");

    auto good = ChecksumVerifier::parse(std::string("sha256:") + kHelloSha256);
    auto bad = ChecksumVerifier::parse("sha256:" + std::string(64, '0'));

    EXPECT_TRUE(ChecksumVerifier::verify(tmp / "hello.txt", good));
    EXPECT_FALSE(ChecksumVerifier::verify(tmp / "hello.txt", bad));
}

TEST(ChecksumTest, ParseNormalizesCaseAndSeparators)
{
    auto parsed = ChecksumVerifier::parse("SHA256:2CF24DBA5FB0A30E26E83B2AC5B9E29E-1B161E5C1FA7425E73043362938B9824");
    EXPECT_EQ(parsed.algorithm, "sha256");
    EXPECT_EQ(parsed.hex, kHelloSha256);
    EXPECT_EQ(parsed.toString(), std::string("sha256:") + kHelloSha256);
}

TEST(ChecksumTest, ParseRejectsMalformedInput)
{
    EXPECT_THROW(ChecksumVerifier::parse("2cf24dba"), std::runtime_error);
    EXPECT_THROW(ChecksumVerifier::parse("md5:d41d8cd98f00b204e9800998ecf8427e"), std::runtime_error);
    EXPECT_THROW(ChecksumVerifier::parse("sha256:abc"), std::runtime_error);
    EXPECT_THROW(ChecksumVerifier::parse("sha256:" + std::string(64, 'g')), std::runtime_error);
}

TEST(ChecksumTest, MissingFileThrows)
{
    TempDir tmp;
    EXPECT_THROW(ChecksumVerifier::computeSHA256(tmp / "missing"), std::runtime_error);
}
