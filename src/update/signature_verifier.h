// src/update/signature_verifier.h
#ifndef LOGWARDEN_SIGNATURE_VERIFIER_H
#define LOGWARDEN_SIGNATURE_VERIFIER_H

#include <string>
#include <vector>

namespace logwarden {
namespace update {

/**
 * RSA-SHA256 detached signature checks for downloaded artifacts.
 * Every failure path returns false; nothing here throws.
 */
class SignatureVerifier {
public:
    /**
     * Strict base64 decode. Whitespace is ignored, anything else
     * outside the alphabet rejects the input.
     */
    static bool DecodeBase64(const std::string& input, std::vector<unsigned char>& output);

    static bool ReadPublicKey(const std::string& path, std::string& pem);

    /**
     * Verify the file contents against a base64 signature using a
     * PEM-encoded RSA public key
     */
    static bool VerifyFile(const std::string& file_path,
                           const std::string& signature_base64,
                           const std::string& public_key_pem,
                           std::string& error);
};

} // namespace update
} // namespace logwarden

#endif // LOGWARDEN_SIGNATURE_VERIFIER_H
