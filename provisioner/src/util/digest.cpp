#include "digest.hpp"

#include <array>
#include <fstream>
#include <stdexcept>

namespace util {

    inline constexpr size_t readChunkSize = 0x10000;

    Sha256::Sha256() : _ctx(EVP_MD_CTX_new()) {
        if(!_ctx) {
            throw std::runtime_error("Unable to allocate digest context");
        }
        if(EVP_DigestInit_ex(_ctx.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("Unable to initialize SHA-256 digest");
        }
    }

    Sha256 &Sha256::update(std::string_view data) {
        if(EVP_DigestUpdate(_ctx.get(), data.data(), data.size()) != 1) {
            throw std::runtime_error("Unable to update SHA-256 digest");
        }
        return *this;
    }

    std::string Sha256::hexDigest() {
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int length = 0;
        if(EVP_DigestFinal_ex(_ctx.get(), digest.data(), &length) != 1) {
            throw std::runtime_error("Unable to finish SHA-256 digest");
        }
        static constexpr std::string_view hexChars{"0123456789abcdef"};
        std::string hex;
        hex.reserve(static_cast<size_t>(length) * 2);
        for(unsigned int i = 0; i < length; ++i) {
            hex.push_back(hexChars[digest[i] >> 4]);
            hex.push_back(hexChars[digest[i] & 0x0F]);
        }
        return hex;
    }

    std::string Sha256::ofFile(const std::filesystem::path &path) {
        std::ifstream stream{path, std::ios::in | std::ios::binary};
        if(!stream.is_open()) {
            throw std::runtime_error("Unable to open " + path.generic_string() + " for hashing");
        }
        Sha256 hasher;
        std::array<char, readChunkSize> buffer{};
        while(stream) {
            stream.read(buffer.data(), buffer.size());
            auto count = stream.gcount();
            if(count > 0) {
                hasher.update({buffer.data(), static_cast<size_t>(count)});
            }
        }
        if(stream.bad()) {
            throw std::runtime_error("Unable to read " + path.generic_string() + " for hashing");
        }
        return hasher.hexDigest();
    }

} // namespace util
