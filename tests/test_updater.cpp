/**
 * @file test_updater.cpp
 * @brief Unit tests for manifest handling, signature checks and fail-closed install
 */

#include <gtest/gtest.h>
#include "update/updater.h"
#include "update/signature_verifier.h"
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <fstream>
#include <map>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

using namespace logwarden;
using namespace logwarden::update;

namespace {

// Serves canned manifests and artifacts from memory
class FakeTransport : public common::HttpTransport {
public:
    std::map<std::string, common::HttpResponse> pages;
    std::map<std::string, std::string> files;
    std::vector<std::string> downloads;

    common::HttpResponse Get(const std::string& url, const std::vector<std::string>&) override {
        auto it = pages.find(url);
        if (it == pages.end()) {
            common::HttpResponse response;
            response.status = 404;
            return response;
        }
        return it->second;
    }

    common::HttpResponse Post(const std::string&, const std::string&,
                              const std::vector<std::string>&) override {
        common::HttpResponse response;
        response.status = 200;
        return response;
    }

    bool Download(const std::string& url, const std::string& dest_path, std::string& error) override {
        downloads.push_back(url);
        auto it = files.find(url);
        if (it == files.end()) {
            error = "HTTP 404";
            return false;
        }
        std::ofstream out(dest_path, std::ios::binary | std::ios::trunc);
        out << it->second;
        return static_cast<bool>(out);
    }

    void Publish(const std::string& json) {
        common::HttpResponse response;
        response.status = 200;
        response.body = json;
        pages["https://updates.example/agent/latest.json"] = response;
    }
};

struct KeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
using KeyPtr = std::unique_ptr<EVP_PKEY, KeyDeleter>;

KeyPtr GenerateKey() {
    EVP_PKEY* key = nullptr;
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    if (ctx && EVP_PKEY_keygen_init(ctx) > 0 &&
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, 2048) > 0) {
        EVP_PKEY_keygen(ctx, &key);
    }
    EVP_PKEY_CTX_free(ctx);
    return KeyPtr(key);
}

std::string PublicPem(EVP_PKEY* key) {
    BIO* bio = BIO_new(BIO_s_mem());
    PEM_write_bio_PUBKEY(bio, key);
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    std::string pem(data, static_cast<size_t>(len));
    BIO_free(bio);
    return pem;
}

std::string SignBase64(EVP_PKEY* key, const std::string& data) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    size_t sig_len = 0;
    std::vector<unsigned char> sig;
    if (EVP_DigestSignInit(ctx, nullptr, EVP_sha256(), nullptr, key) > 0 &&
        EVP_DigestSign(ctx, nullptr, &sig_len,
                       reinterpret_cast<const unsigned char*>(data.data()), data.size()) > 0) {
        sig.resize(sig_len);
        EVP_DigestSign(ctx, sig.data(), &sig_len,
                       reinterpret_cast<const unsigned char*>(data.data()), data.size());
        sig.resize(sig_len);
    }
    EVP_MD_CTX_free(ctx);

    std::string encoded(4 * ((sig.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]), sig.data(),
                            static_cast<int>(sig.size()));
    encoded.resize(static_cast<size_t>(n));
    return encoded;
}

bool FileExists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

std::string ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

} // namespace

class UpdaterTest : public ::testing::Test {
protected:
    static KeyPtr key;
    static KeyPtr other_key;

    std::string dir;
    FakeTransport http;
    Updater::Options options;
    int restarts = 0;

    static void SetUpTestSuite() {
        key = GenerateKey();
        other_key = GenerateKey();
    }

    static void TearDownTestSuite() {
        key.reset();
        other_key.reset();
    }

    void SetUp() override {
        ASSERT_TRUE(key);
        ASSERT_TRUE(other_key);

        char tmpl[] = "/tmp/logwarden_update_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        dir = tmpl;

        options.current_version = "1.0.0";
        options.update_url = "https://updates.example/agent/";
        options.binary_path = dir + "/logwardend";
        options.public_key_path = dir + "/pubkey.pem";
        options.service_name = "logwarden";

        std::ofstream(options.binary_path) << "old binary";
        std::ofstream(options.public_key_path) << PublicPem(key.get());
    }

    void TearDown() override {
        std::string cmd = "rm -rf '" + dir + "'";
        ASSERT_EQ(system(cmd.c_str()), 0);
    }

    Updater MakeUpdater() {
        return Updater(http, options, [this]() { restarts++; return true; });
    }
};

KeyPtr UpdaterTest::key;
KeyPtr UpdaterTest::other_key;

TEST(UpdaterManifestTest, ParseManifest) {
    VersionManifest manifest;
    ASSERT_TRUE(Updater::ParseManifest(
        R"({"version":"1.2.0","url":"https://cdn.example/agent-1.2.0","signature":"c2ln"})",
        "https://updates.example/agent", manifest));
    EXPECT_EQ(manifest.version, "1.2.0");
    EXPECT_EQ(manifest.download_url, "https://cdn.example/agent-1.2.0");
    EXPECT_EQ(manifest.signature, "c2ln");

    // URL defaults to <base>/<version>
    ASSERT_TRUE(Updater::ParseManifest(R"({"version":"1.3.0"})",
                                       "https://updates.example/agent/", manifest));
    EXPECT_EQ(manifest.download_url, "https://updates.example/agent/1.3.0");
    EXPECT_TRUE(manifest.signature.empty());

    EXPECT_FALSE(Updater::ParseManifest("not json", "", manifest));
    EXPECT_FALSE(Updater::ParseManifest(R"({"url":"x"})", "", manifest));
    EXPECT_FALSE(Updater::ParseManifest(R"({"version":12})", "", manifest));
}

TEST(SignatureVerifierTest, StrictBase64) {
    std::vector<unsigned char> out;
    ASSERT_TRUE(SignatureVerifier::DecodeBase64("aGVsbG8=", out));
    EXPECT_EQ(std::string(out.begin(), out.end()), "hello");

    ASSERT_TRUE(SignatureVerifier::DecodeBase64("aGVs\nbG8h", out));
    EXPECT_EQ(std::string(out.begin(), out.end()), "hello!");

    EXPECT_FALSE(SignatureVerifier::DecodeBase64("", out));
    EXPECT_FALSE(SignatureVerifier::DecodeBase64("aGVsbG8", out));
    EXPECT_FALSE(SignatureVerifier::DecodeBase64("aGV*bG8=", out));
    EXPECT_FALSE(SignatureVerifier::DecodeBase64("aG=sbG8=", out));
}

TEST_F(UpdaterTest, UpToDate) {
    http.Publish(R"({"version":"1.0.0"})");
    Updater updater = MakeUpdater();

    EXPECT_EQ(updater.CheckAndInstall(), Updater::UpdateStatus::UP_TO_DATE);
    EXPECT_TRUE(http.downloads.empty());
}

TEST_F(UpdaterTest, FetchFailure) {
    Updater updater = MakeUpdater();
    EXPECT_EQ(updater.CheckAndInstall(), Updater::UpdateStatus::FETCH_FAILED);

    http.Publish("{broken");
    EXPECT_EQ(updater.CheckAndInstall(), Updater::UpdateStatus::FETCH_FAILED);
}

// A correctly signed artifact replaces the binary and triggers a restart
TEST_F(UpdaterTest, InstallsVerifiedArtifact) {
    const std::string artifact = "new binary v1.1.0";
    http.files["https://updates.example/agent/1.1.0"] = artifact;
    http.Publish(R"({"version":"1.1.0","signature":")" + SignBase64(key.get(), artifact) + R"("})");

    Updater updater = MakeUpdater();
    EXPECT_EQ(updater.CheckAndInstall(), Updater::UpdateStatus::INSTALLED);

    EXPECT_EQ(ReadFile(options.binary_path), artifact);
    EXPECT_FALSE(FileExists(options.binary_path + ".download"));
    EXPECT_EQ(restarts, 1);
    EXPECT_EQ(updater.InstalledVersion(), "1.1.0");

    struct stat st;
    ASSERT_EQ(stat(options.binary_path.c_str(), &st), 0);
    EXPECT_TRUE(st.st_mode & S_IXUSR);

    // Already installed, no second download
    EXPECT_EQ(updater.CheckAndInstall(), Updater::UpdateStatus::UP_TO_DATE);
    EXPECT_EQ(http.downloads.size(), 1u);
}

// Signed by the wrong key: deleted, never installed
TEST_F(UpdaterTest, RejectsWrongSigner) {
    const std::string artifact = "evil binary";
    http.files["https://updates.example/agent/1.1.0"] = artifact;
    http.Publish(R"({"version":"1.1.0","signature":")" + SignBase64(other_key.get(), artifact) + R"("})");

    Updater updater = MakeUpdater();
    EXPECT_EQ(updater.CheckAndInstall(), Updater::UpdateStatus::VERIFICATION_FAILED);

    EXPECT_EQ(ReadFile(options.binary_path), "old binary");
    EXPECT_FALSE(FileExists(options.binary_path + ".download"));
    EXPECT_EQ(restarts, 0);
    EXPECT_EQ(updater.InstalledVersion(), "1.0.0");
}

// Artifact altered after signing
TEST_F(UpdaterTest, RejectsTamperedArtifact) {
    http.files["https://updates.example/agent/1.1.0"] = "tampered";
    http.Publish(R"({"version":"1.1.0","signature":")" + SignBase64(key.get(), "original") + R"("})");

    Updater updater = MakeUpdater();
    EXPECT_EQ(updater.CheckAndInstall(), Updater::UpdateStatus::VERIFICATION_FAILED);
    EXPECT_EQ(ReadFile(options.binary_path), "old binary");
}

// No signature: rejected before anything is downloaded
TEST_F(UpdaterTest, RejectsUnsignedManifest) {
    http.files["https://updates.example/agent/1.1.0"] = "unsigned";
    http.Publish(R"({"version":"1.1.0"})");

    Updater updater = MakeUpdater();
    EXPECT_EQ(updater.CheckAndInstall(), Updater::UpdateStatus::VERIFICATION_FAILED);
    EXPECT_TRUE(http.downloads.empty());
}

TEST_F(UpdaterTest, RejectsGarbageSignature) {
    http.files["https://updates.example/agent/1.1.0"] = "artifact";
    http.Publish(R"({"version":"1.1.0","signature":"!!!not-base64!!!"})");

    Updater updater = MakeUpdater();
    EXPECT_EQ(updater.CheckAndInstall(), Updater::UpdateStatus::VERIFICATION_FAILED);
    EXPECT_FALSE(FileExists(options.binary_path + ".download"));
}

TEST_F(UpdaterTest, MissingPublicKeyFailsClosed) {
    const std::string artifact = "new binary";
    http.files["https://updates.example/agent/1.1.0"] = artifact;
    http.Publish(R"({"version":"1.1.0","signature":")" + SignBase64(key.get(), artifact) + R"("})");
    ASSERT_EQ(unlink(options.public_key_path.c_str()), 0);

    Updater updater = MakeUpdater();
    EXPECT_EQ(updater.CheckAndInstall(), Updater::UpdateStatus::VERIFICATION_FAILED);
    EXPECT_EQ(ReadFile(options.binary_path), "old binary");
}

TEST_F(UpdaterTest, DownloadFailure) {
    http.Publish(R"({"version":"1.1.0","signature":"c2ln"})");

    Updater updater = MakeUpdater();
    EXPECT_EQ(updater.CheckAndInstall(), Updater::UpdateStatus::DOWNLOAD_FAILED);
    EXPECT_FALSE(FileExists(options.binary_path + ".download"));
}

// A lower published version is still installed (plain inequality)
TEST_F(UpdaterTest, DowngradeIsInstalled) {
    const std::string artifact = "older binary";
    http.files["https://updates.example/agent/0.9.0"] = artifact;
    http.Publish(R"({"version":"0.9.0","signature":")" + SignBase64(key.get(), artifact) + R"("})");

    Updater updater = MakeUpdater();
    EXPECT_EQ(updater.CheckAndInstall(), Updater::UpdateStatus::INSTALLED);
}
