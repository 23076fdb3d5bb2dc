/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_signature_GpgDriver_hpp
#define ocmirror_signature_GpgDriver_hpp

#include <memory>
#include <string>
#include <vector>
#include <iostream>

#include <boost/format.hpp>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>

#include "libocmirror/CLIArguments.hpp"
#include "libocmirror/LogLevel.hpp"
#include "libocmirror/PathRAII.hpp"
#include "common/Config.hpp"
#include "signature/GpgEngine.hpp"


namespace ocmirror {
namespace signature {

/**
 * GpgEngine driving the gpg executable configured in ocmirror.json.
 *
 * Every invocation runs in batch mode against a dedicated homedir and reports
 * its results through a status file (see doc/DETAILS in the GnuPG sources for
 * the status line format). When no homedir is given, a private keyring is
 * created in the temporary directory and removed together with the driver.
 */
class GpgDriver : public GpgEngine {
public:
    GpgDriver(std::shared_ptr<const common::Config> config);
    GpgDriver(std::shared_ptr<const common::Config> config, const boost::filesystem::path& homedir);

    std::vector<std::string> importKey(const std::string& armoredKey) override;
    std::string sign(const std::string& data, const std::string& keyId, const std::string& passphrase) override;
    GpgVerification verify(const std::string& signedData) override;

    const boost::filesystem::path& getHomedir() const;

    static GpgVerification parseVerificationStatus(const std::string& statusOutput);

private:
    libocmirror::CLIArguments generateBaseArgs(const boost::filesystem::path& statusFile) const;
    libocmirror::PathRAII makeWorkDirectory() const;
    void setUltimateOwnertrust(const std::vector<std::string>& fingerprints) const;
    void printLog(const boost::format& message, libocmirror::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    std::shared_ptr<const common::Config> config;
    boost::filesystem::path gpgPath;
    boost::optional<libocmirror::PathRAII> ownedHomedir;
    boost::filesystem::path homedir;
    const std::string sysname = "GpgDriver";
};

}
}

#endif
