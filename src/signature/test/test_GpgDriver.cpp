/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <memory>
#include <sstream>

#include <boost/algorithm/string.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/CLIArguments.hpp"
#include "libocmirror/PathRAII.hpp"
#include "libocmirror/Utility.hpp"
#include "common/ImageReference.hpp"
#include "signature/AtomicSigner.hpp"
#include "signature/GpgDriver.hpp"
#include "signature/SignatureStore.hpp"
#include "signature/VerificationResult.hpp"
#include "test_utility/config.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace ocmirror {
namespace signature {
namespace test {

static const std::string passphrase = "correct horse battery staple";
static const std::string uid = "Release Signer <signer@example.com>";

static std::string runGpg(const boost::filesystem::path& homedir, const libocmirror::CLIArguments& args) {
    auto output = std::stringstream{};
    auto fullArgs = libocmirror::CLIArguments{"gpg", "--homedir", homedir.string(), "--batch", "--no-tty"} + args;
    auto status = libocmirror::process::forkExecWait(fullArgs, &output);
    CHECK_EQUAL(0, status);
    return output.str();
}

// generates a signing key and returns its fingerprint
static std::string generateKey(const boost::filesystem::path& homedir) {
    runGpg(homedir, libocmirror::CLIArguments{"--pinentry-mode", "loopback", "--passphrase", passphrase,
                                              "--quick-gen-key", uid, "ed25519", "sign", "never"});
    auto listing = std::istringstream{runGpg(homedir, libocmirror::CLIArguments{"--with-colons", "--list-secret-keys"})};
    auto line = std::string{};
    while(std::getline(listing, line)) {
        if(line.compare(0, 4, "fpr:") == 0) {
            auto fields = std::vector<std::string>{};
            boost::split(fields, line, boost::is_any_of(":"));
            return fields.at(9);
        }
    }
    FAIL("No fingerprint in gpg key listing");
    return std::string{};
}

TEST_GROUP(GpgDriverTestGroup) {
};

TEST(GpgDriverTestGroup, parseGoodSignature) {
    auto status = std::string{
        "[GNUPG:] NEWSIG\n"
        "[GNUPG:] KEY_CONSIDERED 6E2C1A9F3D5B7A8C9E0F1A2B3C4D5E6F7A8B9C0D 0\n"
        "[GNUPG:] SIG_ID abcdefg 2020-05-20 1590000000\n"
        "[GNUPG:] GOODSIG 7A8B9C0D11223344 Release Signer <signer@example.com>\n"
        "[GNUPG:] VALIDSIG 6E2C1A9F3D5B7A8C9E0F1A2B3C4D5E6F7A8B9C0D 2020-05-20 1590000000 0 4 0 22 10 00 6E2C1A9F3D5B7A8C9E0F1A2B3C4D5E6F7A8B9C0D\n"
        "[GNUPG:] TRUST_ULTIMATE 0 pgp\n"
    };
    auto result = GpgDriver::parseVerificationStatus(status);
    CHECK_EQUAL(status::SIGNATURE_VALID, result.status);
    CHECK_EQUAL(std::string{"7A8B9C0D11223344"}, result.keyId);
    CHECK_EQUAL(std::string{"Release Signer <signer@example.com>"}, result.username);
    CHECK_EQUAL(std::string{"6E2C1A9F3D5B7A8C9E0F1A2B3C4D5E6F7A8B9C0D"}, *result.fingerprint);
    CHECK_EQUAL(1590000000, *result.timestamp);
    CHECK(result.trust == GpgTrust::ULTIMATE);
}

TEST(GpgDriverTestGroup, parseFailedSignatures) {
    auto result = GpgDriver::parseVerificationStatus(
        "[GNUPG:] BADSIG 7A8B9C0D11223344 Release Signer <signer@example.com>\n");
    CHECK_EQUAL(status::SIGNATURE_BAD, result.status);
    CHECK(!result.fingerprint);
    CHECK(result.trust == GpgTrust::UNDEFINED);

    result = GpgDriver::parseVerificationStatus(
        "[GNUPG:] ERRSIG 7A8B9C0D11223344 22 10 00 1590000000 9 -\n"
        "[GNUPG:] NO_PUBKEY 7A8B9C0D11223344\n");
    CHECK_EQUAL(status::NO_PUBLIC_KEY, result.status);
    CHECK_EQUAL(std::string{"7A8B9C0D11223344"}, result.keyId);

    result = GpgDriver::parseVerificationStatus("[GNUPG:] ERRSIG 7A8B9C0D11223344 22 10 00 1590000000 4 -\n");
    CHECK_EQUAL(status::SIGNATURE_ERROR, result.status);

    CHECK_EQUAL(status::KEY_EXPIRED, GpgDriver::parseVerificationStatus("[GNUPG:] EXPKEYSIG 7A8B9C0D11223344 A\n").status);
    CHECK_EQUAL(status::KEY_REVOKED, GpgDriver::parseVerificationStatus("[GNUPG:] REVKEYSIG 7A8B9C0D11223344 A\n").status);
    CHECK_EQUAL(status::SIGNATURE_EXPIRED, GpgDriver::parseVerificationStatus("[GNUPG:] EXPSIG 7A8B9C0D11223344 A\n").status);
    CHECK_EQUAL(status::NO_SIGNATURE, GpgDriver::parseVerificationStatus("").status);
    CHECK_EQUAL(status::NO_SIGNATURE, GpgDriver::parseVerificationStatus("gpg: no valid OpenPGP data found.\n").status);
}

TEST(GpgDriverTestGroup, trustLevels) {
    CHECK(parseGpgTrust("MARGINAL") == GpgTrust::MARGINAL);
    CHECK(GpgTrust::ULTIMATE > GpgTrust::FULLY);
    CHECK(GpgTrust::FULLY > GpgTrust::MARGINAL);
    CHECK(GpgTrust::UNDEFINED > GpgTrust::NEVER);
    CHECK_EQUAL(std::string{"FULLY"}, toString(GpgTrust::FULLY));
    CHECK_THROWS(libocmirror::Error, parseGpgTrust("fully"));
}

TEST(GpgDriverTestGroup, signAndVerifyWithGpg) {
    auto configRAII = test_utility::config::makeConfig();
    auto signerHome = libocmirror::PathRAII{
        libocmirror::filesystem::makeTemporaryDirectory(configRAII.config->getTempDir(), "signer")
    };
    auto fingerprint = generateKey(signerHome.getPath());
    auto publicKey = runGpg(signerHome.getPath(), libocmirror::CLIArguments{"--armor", "--export", fingerprint});

    auto signer = GpgDriver{configRAII.config, signerHome.getPath()};
    auto data = std::string{"payload to sign\n"};
    auto signedData = signer.sign(data, fingerprint, passphrase);
    CHECK(signedData != data);

    auto verifier = GpgDriver{configRAII.config};
    CHECK(boost::filesystem::is_directory(verifier.getHomedir()));

    // unknown signer
    auto unverified = verifier.verify(signedData);
    CHECK_EQUAL(status::NO_PUBLIC_KEY, unverified.status);
    CHECK(!unverified.fingerprint);

    auto imported = verifier.importKey(publicKey);
    CHECK_EQUAL(1, imported.size());
    CHECK_EQUAL(fingerprint, imported[0]);

    auto verified = verifier.verify(signedData);
    CHECK_EQUAL(status::SIGNATURE_VALID, verified.status);
    CHECK_EQUAL(fingerprint, *verified.fingerprint);
    CHECK(fingerprint.size() > 16 && fingerprint.substr(fingerprint.size() - 16) == verified.keyId);
    CHECK_EQUAL(uid, verified.username);
    CHECK(verified.trust == GpgTrust::ULTIMATE);
    CHECK(verified.timestamp);
    CHECK_EQUAL(data, verified.payload);

    CHECK(verifier.verify("not signed at all").status != status::SIGNATURE_VALID);
    CHECK_THROWS(libocmirror::Error, verifier.importKey("not a key"));
}

TEST(GpgDriverTestGroup, atomicSignaturesWithGpg) {
    auto configRAII = test_utility::config::makeConfig();
    auto signerHome = libocmirror::PathRAII{
        libocmirror::filesystem::makeTemporaryDirectory(configRAII.config->getTempDir(), "signer")
    };
    auto storeDir = libocmirror::PathRAII{
        libocmirror::filesystem::makeTemporaryDirectory(configRAII.config->getTempDir(), "signatures")
    };
    auto fingerprint = generateKey(signerHome.getPath());

    auto gpg = std::make_shared<GpgDriver>(configRAII.config, signerHome.getPath());
    auto store = makeSignatureStore(configRAII.config);
    auto location = "file://" + storeDir.getPath().string();
    auto signer = AtomicSigner{configRAII.config, gpg, store, {location}};
    signer.setSigningIdentity(AtomicSigner::SigningIdentity{fingerprint, passphrase});

    auto reference = common::ImageReference::parse("quay.io/openshift-release-dev/ocp-release:4.4.6-x86_64");
    auto digest = libocmirror::digest::computeSha256("release manifest");
    auto url = signer.atomicsign(digest, reference);
    CHECK_EQUAL(AtomicSigner::makeSignatureUrl(location, digest, 1), url);

    auto result = signer.atomicverify(digest, reference);
    CHECK(result);
    CHECK(isValid(*result));
    CHECK_EQUAL(std::string{"atomicsigner"}, getType(*result));
    CHECK_EQUAL(fingerprint, *getDetails(*result).fingerprint);
    CHECK_EQUAL(std::string{status::SIGNATURE_VALID}, getDetails(*result).statusGpg);
    CHECK(!getDetails(*result).statusAtomic);

    // a good GPG signature over something else than an atomic payload
    auto otherDigest = libocmirror::digest::computeSha256("other manifest");
    store->publish(AtomicSigner::makeSignatureUrl(location, otherDigest, 1), gpg->sign("not a payload", fingerprint, passphrase));
    result = signer.atomicverify(otherDigest, reference);
    CHECK(result);
    CHECK(!isValid(*result));
    CHECK_EQUAL(std::string{"gpg"}, getType(*result));
    CHECK(!getDetails(*result).fingerprint);
    CHECK(getDetails(*result).statusAtomic);

    CHECK(!signer.atomicverify(libocmirror::digest::computeSha256("unsigned"), reference));
}

TEST(GpgDriverTestGroup, privateHomedirIsRemoved) {
    auto configRAII = test_utility::config::makeConfig();
    auto homedir = boost::filesystem::path{};
    {
        auto driver = GpgDriver{configRAII.config};
        homedir = driver.getHomedir();
        CHECK(boost::filesystem::exists(homedir));
    }
    CHECK(!boost::filesystem::exists(homedir));
    CHECK_THROWS(libocmirror::Error, GpgDriver(configRAII.config, configRAII.config->getTempDir() / "missing"));
}

}}}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
