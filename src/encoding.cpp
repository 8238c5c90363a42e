#include "encoding.h"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace droidrun {

std::string Encoding::base64_encode(const unsigned char* data, size_t len) {
    if (len == 0) return "";

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(bio, data, static_cast<int>(len));
    BIO_flush(bio);

    BUF_MEM* bufferPtr;
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);

    return result;
}

std::string Encoding::base64_encode(const std::string& data) {
    return base64_encode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::vector<unsigned char> Encoding::base64_decode(const std::string& encoded) {
    if (encoded.empty()) return {};

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bio = BIO_new_mem_buf(encoded.c_str(), static_cast<int>(encoded.length()));
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);

    std::vector<unsigned char> result(encoded.length());
    int decoded_len = BIO_read(bio, result.data(), static_cast<int>(encoded.length()));

    BIO_free_all(bio);

    if (decoded_len > 0) {
        result.resize(decoded_len);
    } else {
        result.clear();
    }

    return result;
}

std::string Encoding::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string Encoding::sha256_string(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);
    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string Encoding::random_hex(size_t num_bytes) {
    std::vector<unsigned char> bytes(num_bytes);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return bytes_to_hex(bytes.data(), bytes.size());
}

} // namespace droidrun
