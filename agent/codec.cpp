#include "codec.h"
#include <stdexcept>
#include <vector>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>

std::string base64Encode(const std::string& input) {
    if (input.empty()) {
        return "";
    }

    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    if (!bio || !b64) {
        BIO_free(bio);
        BIO_free(b64);
        throw std::runtime_error("base64: BIO allocation failed");
    }
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);

    bio = BIO_push(b64, bio);

    BIO_write(bio, input.data(), static_cast<int>(input.length()));
    BIO_flush(bio);

    BUF_MEM* buffer_ptr = nullptr;
    BIO_get_mem_ptr(bio, &buffer_ptr);

    std::string result(buffer_ptr->data, buffer_ptr->length);

    BIO_free_all(bio);

    return result;
}

std::string base64Decode(const std::string& input) {
    if (input.empty()) {
        return "";
    }

    BIO* bio = BIO_new_mem_buf(input.data(), static_cast<int>(input.length()));
    BIO* b64 = BIO_new(BIO_f_base64());
    if (!bio || !b64) {
        BIO_free(bio);
        BIO_free(b64);
        throw std::runtime_error("base64: BIO allocation failed");
    }
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);

    bio = BIO_push(b64, bio);

    std::string result;
    std::vector<char> buffer(4096);
    int n;
    while ((n = BIO_read(bio, buffer.data(), static_cast<int>(buffer.size()))) > 0) {
        result.append(buffer.data(), static_cast<size_t>(n));
    }

    BIO_free_all(bio);

    if (n < 0) {
        throw std::runtime_error("base64: malformed input");
    }
    return result;
}
