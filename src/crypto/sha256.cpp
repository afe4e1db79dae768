#include "crypto/sha256.hpp"

#include "io/file_reader.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <vector>

namespace hotpush {

namespace {

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

    bool Init() { return ok() && EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) == 1; }

    bool Update(std::span<const std::uint8_t> data) {
        if (data.empty()) return true;
        return EVP_DigestUpdate(ctx_, data.data(), data.size()) == 1;
    }

    std::string FinalHex() {
        std::array<std::uint8_t, 32> digest{};
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_, digest.data(), &len) != 1) return {};
        if (len != digest.size()) return {};
        return HexEncode(digest);
    }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

} // namespace

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    EvpCtx ctx;
    if (!ctx.Init() || !ctx.Update(data)) return {};
    return ctx.FinalHex();
}

std::string Sha256Hex(std::string_view text) {
    return Sha256Hex(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

std::string Sha256Hex(IReader& reader) {
    EvpCtx ctx;
    if (!ctx.Init()) return {};

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return {};
        if (!ctx.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)))) {
            return {};
        }
    }
    return ctx.FinalHex();
}

Result Sha256HexFile(const std::string& path, std::string& out_hex) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.is_ok()) return r;
    out_hex = Sha256Hex(reader);
    if (out_hex.empty()) return Result::Fail(-1, "sha256 failed: " + path);
    return Result::Ok();
}

} // namespace hotpush
