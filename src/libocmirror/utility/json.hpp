/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libocmirror_utility_json_hpp
#define libocmirror_utility_json_hpp

#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>
#include <rapidjson/schema.h>

/**
 * Utility functions for JSON operations
 */

namespace libocmirror {
namespace json {

rapidjson::SchemaDocument readSchema(const boost::filesystem::path& schemaFile);
rapidjson::Document parse(const std::string& string);
rapidjson::Document read(const boost::filesystem::path& filename);
rapidjson::Document readAndValidate(const boost::filesystem::path& jsonFile,
                                    const boost::filesystem::path& schemaFile);
std::string serialize(const rapidjson::Value& json);

const rapidjson::Value& getMember(const rapidjson::Value& object, const char* name);
std::string getString(const rapidjson::Value& object, const char* name);
std::vector<std::string> getStringArray(const rapidjson::Value& object, const char* name);

}}

#endif
