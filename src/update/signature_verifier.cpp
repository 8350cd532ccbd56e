// src/update/signature_verifier.cpp
#include "signature_verifier.h"
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/bio.h>
#include <fstream>
#include <sstream>
#include <cctype>

namespace logwarden {
namespace update {

bool SignatureVerifier::DecodeBase64(const std::string& input, std::vector<unsigned char>& output) {
    std::string clean;
    clean.reserve(input.size());
    for (char c : input) {
        if (isspace(static_cast<unsigned char>(c))) continue;
        if (!isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '/' && c != '=') {
            return false;
        }
        clean += c;
    }

    if (clean.empty() || clean.size() % 4 != 0) {
        return false;
    }

    size_t padding = 0;
    if (clean[clean.size() - 1] == '=') padding++;
    if (clean[clean.size() - 2] == '=') padding++;
    if (clean.find('=') < clean.size() - padding) {
        return false;  // '=' only allowed at the end
    }

    output.resize(clean.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(output.data(),
                                  reinterpret_cast<const unsigned char*>(clean.data()),
                                  static_cast<int>(clean.size()));
    if (decoded < 0) {
        output.clear();
        return false;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    output.resize(static_cast<size_t>(decoded) - padding);
    return true;
}

bool SignatureVerifier::ReadPublicKey(const std::string& path, std::string& pem) {
    std::ifstream file(path);
    if (!file) {
        return false;
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    pem = oss.str();
    return !pem.empty();
}

bool SignatureVerifier::VerifyFile(const std::string& file_path,
                                   const std::string& signature_base64,
                                   const std::string& public_key_pem,
                                   std::string& error) {
    std::vector<unsigned char> signature;
    if (!DecodeBase64(signature_base64, signature) || signature.empty()) {
        error = "signature is not valid base64";
        return false;
    }

    BIO* bio = BIO_new_mem_buf(public_key_pem.data(), static_cast<int>(public_key_pem.size()));
    if (!bio) {
        error = "cannot allocate key buffer";
        return false;
    }
    EVP_PKEY* pkey = PEM_read_bio_PUBKEY(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!pkey) {
        error = "public key is not valid PEM";
        return false;
    }
    if (EVP_PKEY_base_id(pkey) != EVP_PKEY_RSA) {
        EVP_PKEY_free(pkey);
        error = "public key is not RSA";
        return false;
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        EVP_PKEY_free(pkey);
        error = "cannot read " + file_path;
        return false;
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        EVP_PKEY_free(pkey);
        error = "cannot allocate digest context";
        return false;
    }

    if (EVP_DigestVerifyInit(ctx, nullptr, EVP_sha256(), nullptr, pkey) != 1) {
        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        error = "digest init failed";
        return false;
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestVerifyUpdate(ctx, buffer, file.gcount()) != 1) {
            EVP_MD_CTX_free(ctx);
            EVP_PKEY_free(pkey);
            error = "digest update failed";
            return false;
        }
    }

    int result = EVP_DigestVerifyFinal(ctx, signature.data(), signature.size());

    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);

    if (result != 1) {
        error = "signature mismatch";
        return false;
    }
    return true;
}

} // namespace update
} // namespace logwarden
