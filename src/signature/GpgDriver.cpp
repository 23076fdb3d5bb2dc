/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "signature/GpgDriver.hpp"

#include <sstream>

#include <boost/algorithm/string.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "libocmirror/Utility.hpp"


namespace ocmirror {
namespace signature {

GpgDriver::GpgDriver(std::shared_ptr<const common::Config> config)
    : config{std::move(config)}
    , gpgPath{this->config->getGpgPath()}
{
    ownedHomedir = libocmirror::PathRAII{
        libocmirror::filesystem::makeTemporaryDirectory(this->config->getTempDir(), "gnupg")
    };
    homedir = ownedHomedir->getPath();
    printLog(boost::format("Created private GPG homedir %s") % homedir, libocmirror::LogLevel::DEBUG);
}

GpgDriver::GpgDriver(std::shared_ptr<const common::Config> config, const boost::filesystem::path& homedir)
    : config{std::move(config)}
    , gpgPath{this->config->getGpgPath()}
    , homedir{homedir}
{
    if(!boost::filesystem::is_directory(homedir)) {
        auto message = boost::format("GPG homedir %s is not a directory") % homedir;
        OCMIRROR_THROW_ERROR(message.str());
    }
}

const boost::filesystem::path& GpgDriver::getHomedir() const {
    return homedir;
}

std::vector<std::string> GpgDriver::importKey(const std::string& armoredKey) {
    auto workDir = makeWorkDirectory();
    auto keyFile = workDir.getPath() / "key.asc";
    auto statusFile = workDir.getPath() / "status";
    libocmirror::filesystem::writeFile(armoredKey, keyFile);

    auto args = generateBaseArgs(statusFile) + libocmirror::CLIArguments{"--import", keyFile.string()};
    auto exitStatus = libocmirror::process::forkExecWait(args);

    auto fingerprints = std::vector<std::string>{};
    auto statusOutput = std::istringstream{libocmirror::filesystem::readFile(statusFile)};
    auto line = std::string{};
    while(std::getline(statusOutput, line)) {
        auto tokens = libocmirror::string::splitWhitespaceSeparated(line);
        // [GNUPG:] IMPORT_OK <reason> <fingerprint>
        if(tokens.size() >= 4 && tokens[1] == "IMPORT_OK") {
            if(std::find(fingerprints.cbegin(), fingerprints.cend(), tokens[3]) == fingerprints.cend()) {
                fingerprints.push_back(tokens[3]);
            }
        }
    }

    if(fingerprints.empty()) {
        auto message = boost::format("Failed to import GPG key (gpg exited with status %d)") % exitStatus;
        OCMIRROR_THROW_ERROR(message.str());
    }

    setUltimateOwnertrust(fingerprints);
    printLog(boost::format("Imported GPG key(s): %s") % boost::algorithm::join(fingerprints, ", "),
             libocmirror::LogLevel::INFO);
    return fingerprints;
}

void GpgDriver::setUltimateOwnertrust(const std::vector<std::string>& fingerprints) const {
    auto workDir = makeWorkDirectory();
    auto ownertrustFile = workDir.getPath() / "ownertrust";
    auto statusFile = workDir.getPath() / "status";

    auto ownertrust = std::string{};
    for(const auto& fingerprint : fingerprints) {
        ownertrust += fingerprint + ":6:\n";
    }
    libocmirror::filesystem::writeFile(ownertrust, ownertrustFile);

    auto args = generateBaseArgs(statusFile) + libocmirror::CLIArguments{"--import-ownertrust", ownertrustFile.string()};
    auto exitStatus = libocmirror::process::forkExecWait(args);
    if(exitStatus != 0) {
        auto message = boost::format("Failed to set ownertrust of imported GPG keys (gpg exited with status %d)") % exitStatus;
        OCMIRROR_THROW_ERROR(message.str());
    }
}

std::string GpgDriver::sign(const std::string& data, const std::string& keyId, const std::string& passphrase) {
    auto workDir = makeWorkDirectory();
    auto dataFile = workDir.getPath() / "data";
    auto signedFile = workDir.getPath() / "data.gpg";
    auto statusFile = workDir.getPath() / "status";
    libocmirror::filesystem::writeFile(data, dataFile);

    auto args = generateBaseArgs(statusFile);
    if(!passphrase.empty()) {
        auto passphraseFile = workDir.getPath() / "passphrase";
        libocmirror::filesystem::writeFile(passphrase, passphraseFile);
        boost::filesystem::permissions(passphraseFile, boost::filesystem::perms::owner_read | boost::filesystem::perms::owner_write);
        args += libocmirror::CLIArguments{"--pinentry-mode", "loopback", "--passphrase-file", passphraseFile.string()};
    }
    args += libocmirror::CLIArguments{"--local-user", keyId, "--output", signedFile.string(), "--sign", dataFile.string()};

    auto exitStatus = libocmirror::process::forkExecWait(args);
    if(exitStatus != 0 || !boost::filesystem::exists(signedFile)) {
        auto message = boost::format("Failed to sign data with GPG key %s (gpg exited with status %d)") % keyId % exitStatus;
        OCMIRROR_THROW_ERROR(message.str());
    }

    printLog(boost::format("Signed %d bytes with GPG key %s") % data.size() % keyId, libocmirror::LogLevel::DEBUG);
    return libocmirror::filesystem::readFile(signedFile);
}

GpgVerification GpgDriver::verify(const std::string& signedData) {
    auto workDir = makeWorkDirectory();
    auto signedFile = workDir.getPath() / "data.gpg";
    auto payloadFile = workDir.getPath() / "data";
    auto statusFile = workDir.getPath() / "status";
    libocmirror::filesystem::writeFile(signedData, signedFile);

    // a non-zero exit status denotes a bad or unverifiable signature, detailed by the status output
    auto args = generateBaseArgs(statusFile) + libocmirror::CLIArguments{"--output", payloadFile.string(), "--decrypt", signedFile.string()};
    auto exitStatus = libocmirror::process::forkExecWait(args);
    printLog(boost::format("gpg verification exited with status %d") % exitStatus, libocmirror::LogLevel::DEBUG);

    auto result = parseVerificationStatus(libocmirror::filesystem::readFile(statusFile));
    if(boost::filesystem::exists(payloadFile)) {
        result.payload = libocmirror::filesystem::readFile(payloadFile);
    }

    printLog(boost::format("GPG verification: status=%s keyid=%s trust=%s") % result.status % result.keyId % result.trust,
             libocmirror::LogLevel::DEBUG);
    return result;
}

GpgVerification GpgDriver::parseVerificationStatus(const std::string& statusOutput) {
    auto result = GpgVerification{};

    auto setSigner = [&result](const std::vector<std::string>& tokens, const std::string& status) {
        result.status = status;
        if(tokens.size() >= 3) {
            result.keyId = tokens[2];
        }
        if(tokens.size() >= 4) {
            result.username = boost::algorithm::join(std::vector<std::string>(tokens.cbegin() + 3, tokens.cend()), " ");
        }
    };

    auto stream = std::istringstream{statusOutput};
    auto line = std::string{};
    while(std::getline(stream, line)) {
        auto tokens = libocmirror::string::splitWhitespaceSeparated(line);
        if(tokens.size() < 2 || tokens[0] != "[GNUPG:]") {
            continue;
        }
        const auto& keyword = tokens[1];

        if(keyword == "GOODSIG") {
            setSigner(tokens, status::SIGNATURE_VALID);
        }
        else if(keyword == "BADSIG") {
            setSigner(tokens, status::SIGNATURE_BAD);
        }
        else if(keyword == "EXPSIG") {
            setSigner(tokens, status::SIGNATURE_EXPIRED);
        }
        else if(keyword == "EXPKEYSIG") {
            setSigner(tokens, status::KEY_EXPIRED);
        }
        else if(keyword == "REVKEYSIG") {
            setSigner(tokens, status::KEY_REVOKED);
        }
        else if(keyword == "ERRSIG") {
            // ERRSIG <keyid> <pkalgo> <hashalgo> <sig_class> <time> <rc> [<fpr>]
            result.keyId = tokens.size() >= 3 ? tokens[2] : std::string{};
            result.status = (tokens.size() >= 8 && tokens[7] == "9") ? status::NO_PUBLIC_KEY : status::SIGNATURE_ERROR;
        }
        else if(keyword == "NO_PUBKEY") {
            result.status = status::NO_PUBLIC_KEY;
            if(tokens.size() >= 3) {
                result.keyId = tokens[2];
            }
        }
        else if(keyword == "VALIDSIG") {
            // VALIDSIG <fpr> <sig_creation_date> <sig-timestamp> ...
            if(tokens.size() >= 3) {
                result.fingerprint = tokens[2];
            }
            if(tokens.size() >= 5 && !tokens[4].empty()
               && tokens[4].find_first_not_of("0123456789") == std::string::npos) {
                result.timestamp = std::stoll(tokens[4]);
            }
        }
        else if(boost::algorithm::starts_with(keyword, "TRUST_")) {
            try {
                result.trust = parseGpgTrust(keyword.substr(6));
            }
            catch(libocmirror::Error& e) {
                OCMIRROR_RETHROW_ERROR(e, "Failed to parse gpg status output");
            }
        }
    }

    return result;
}

libocmirror::CLIArguments GpgDriver::generateBaseArgs(const boost::filesystem::path& statusFile) const {
    auto args = libocmirror::CLIArguments{gpgPath.string(), "--homedir", homedir.string(),
                                          "--batch", "--no-tty", "--yes", "--status-file", statusFile.string()};
    if(libocmirror::Logger::getInstance().getLevel() != libocmirror::LogLevel::DEBUG) {
        args.push_back("--quiet");
    }
    return args;
}

libocmirror::PathRAII GpgDriver::makeWorkDirectory() const {
    return libocmirror::PathRAII{libocmirror::filesystem::makeTemporaryDirectory(config->getTempDir(), "gpg-work")};
}

void GpgDriver::printLog(const boost::format& message, libocmirror::LogLevel level,
                         std::ostream& outStream, std::ostream& errStream) const {
    libocmirror::Logger::getInstance().log(message.str(), sysname, level, outStream, errStream);
}

}
}
