#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "testing.hpp"

#include <algorithm>
#include <cstring>
#include <string>

namespace hotpush {

class StringReader final : public IReader {
public:
    explicit StringReader(std::string data) : data_(std::move(data)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size()) return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::memcpy(out.data(), data_.data() + pos_, n);
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

private:
    std::string data_;
    size_t pos_ = 0;
};

constexpr const char* kAbcDigest =
    "ba7816bf8f01cfea414140de5dae2223"
    "b00361a396177a9cb410ff61f20015ad";

TEST(Sha256Test, KnownVector) {
    StringReader reader("abc");
    EXPECT_EQ(Sha256Hex(reader), kAbcDigest);
    EXPECT_EQ(Sha256Hex(std::string_view("abc")), kAbcDigest);
}

TEST(Sha256Test, EmptyInput) {
    EXPECT_EQ(Sha256Hex(std::string_view("")),
              "e3b0c44298fc1c149afbf4c8996fb924"
              "27ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, HashesFile) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/abc.txt";
    ASSERT_TRUE(testutil::WriteTextFile(path, "abc"));

    std::string hex;
    auto res = Sha256HexFile(path, hex);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(hex, kAbcDigest);

    res = Sha256HexFile(tmp.Path() + "/missing", hex);
    EXPECT_FALSE(res.is_ok());
}

} // namespace hotpush
