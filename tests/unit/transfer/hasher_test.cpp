#include <gtest/gtest.h>

#include <omnifetch/transfer/transfer.hpp>

#include "../../common/test_helpers.h"

using namespace omnifetch;
using namespace omnifetch::transfer;

namespace {

ByteSpan bytes(const std::string& s) {
    return ByteSpan{reinterpret_cast<const std::byte*>(s.data()), s.size()};
}

} // namespace

TEST(HasherTest, KnownDigests) {
    Hasher sha256(ChecksumAlgorithm::Sha256);
    EXPECT_EQ(sha256.hexDigest(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    sha256.update(bytes("abc"));
    EXPECT_EQ(sha256.hexDigest(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    Hasher md5(ChecksumAlgorithm::Md5);
    md5.update(bytes("abc"));
    EXPECT_EQ(md5.hexDigest(), "900150983cd24fb0d6963f7d28e17f72");

    Hasher sha512(ChecksumAlgorithm::Sha512);
    sha512.update(bytes("abc"));
    EXPECT_EQ(sha512.hexDigest(),
              "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
              "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
}

TEST(HasherTest, RunningDigestCanBeCheckpointed) {
    Hasher incremental;
    incremental.update(bytes("ab"));
    const auto mid = incremental.hexDigest();
    incremental.update(bytes("c"));

    Hasher prefix;
    prefix.update(bytes("ab"));
    EXPECT_EQ(mid, prefix.hexDigest());
    EXPECT_EQ(incremental.hexDigest(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    incremental.reset();
    EXPECT_EQ(incremental.hexDigest(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HasherTest, UpdateFromFilePrefix) {
    tests::TempDir dir;
    const auto data = tests::make_payload(200000);
    auto path = tests::write_file(dir / "blob", data);

    Hasher fromFile;
    ASSERT_TRUE(fromFile.updateFromFile(path, 150000));
    Hasher direct;
    direct.update(bytes(data.substr(0, 150000)));
    EXPECT_EQ(fromFile.hexDigest(), direct.hexDigest());

    Hasher tooLong;
    auto r = tooLong.updateFromFile(path, data.size() + 1);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::IoError);
}
