/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "json.hpp"

#include <fstream>

#include <boost/format.hpp>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/error/en.h>
#include <rapidjson/writer.h>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/filesystem.hpp"

namespace libocmirror {
namespace json {

rapidjson::Document parse(const std::string& string) {
    auto json = rapidjson::Document{};
    json.Parse(string.c_str(), string.size());
    if (json.HasParseError()) {
        auto message = boost::format(
            "Error parsing JSON string:\n'%s'\nInput data is not valid JSON\n"
            "Error(offset %u): %s")
            % string
            % static_cast<unsigned>(json.GetErrorOffset())
            % rapidjson::GetParseError_En(json.GetParseError());
        OCMIRROR_THROW_ERROR(message.str());
    }
    return json;
}

rapidjson::Document read(const boost::filesystem::path& filename) {
    auto content = filesystem::readFile(filename);
    auto json = rapidjson::Document{};
    json.Parse(content.c_str(), content.size());
    if (json.HasParseError()) {
        auto message = boost::format(
            "Error parsing JSON file %s. Input data is not valid JSON\n"
            "Error(offset %u): %s")
            % filename
            % static_cast<unsigned>(json.GetErrorOffset())
            % rapidjson::GetParseError_En(json.GetParseError());
        OCMIRROR_THROW_ERROR(message.str());
    }
    return json;
}

rapidjson::SchemaDocument readSchema(const boost::filesystem::path& schemaFile) {
    auto schemaJSON = json::read(schemaFile);
    return rapidjson::SchemaDocument{ schemaJSON };
}

rapidjson::Document readAndValidate(const boost::filesystem::path& jsonFile, const boost::filesystem::path& schemaFile) {
    auto schema = readSchema(schemaFile);

    rapidjson::Document json;

    try {
        std::ifstream inputStream(jsonFile.string());
        if(!inputStream) {
            auto message = boost::format("Failed to open JSON file %s") % jsonFile;
            OCMIRROR_THROW_ERROR(message.str());
        }
        rapidjson::IStreamWrapper streamWrapper(inputStream);
        // Parse while validating the SAX events against the schema
        rapidjson::SchemaValidatingReader<rapidjson::kParseDefaultFlags, rapidjson::IStreamWrapper, rapidjson::UTF8<> > reader(streamWrapper, schema);
        json.Populate(reader);

        if (!reader.GetParseResult()) {
            if (!reader.IsValid()) {
                rapidjson::StringBuffer sb;
                reader.GetInvalidSchemaPointer().StringifyUriFragment(sb);
                auto message = boost::format("Invalid schema: %s\n") % sb.GetString();
                message = boost::format("%sInvalid keyword: %s\n") % message % reader.GetInvalidSchemaKeyword();
                sb.Clear();
                reader.GetInvalidDocumentPointer().StringifyUriFragment(sb);
                message = boost::format("%sInvalid document: %s\n") % message % sb.GetString();
                sb.Clear();
                rapidjson::PrettyWriter<rapidjson::StringBuffer> w(sb);
                reader.GetError().Accept(w);
                message = boost::format("%sError report:\n%s") % message % sb.GetString();
                OCMIRROR_THROW_ERROR(message.str());
            }
            else {
                auto message = boost::format("Error parsing JSON file: %s") % jsonFile;
                OCMIRROR_THROW_ERROR(message.str());
            }
        }
    }
    catch(const Error&) {
        throw;
    }
    catch (const std::exception& e) {
        auto message = boost::format("Error reading JSON file %s") % jsonFile;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }

    return json;
}

std::string serialize(const rapidjson::Value& json) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    json.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

const rapidjson::Value& getMember(const rapidjson::Value& object, const char* name) {
    if(!object.IsObject()) {
        auto message = boost::format("Failed to get JSON member \"%s\": value is not an object") % name;
        OCMIRROR_THROW_ERROR(message.str());
    }
    auto it = object.FindMember(name);
    if(it == object.MemberEnd()) {
        auto message = boost::format("JSON object has no member \"%s\": %s") % name % serialize(object);
        OCMIRROR_THROW_ERROR(message.str());
    }
    return it->value;
}

std::string getString(const rapidjson::Value& object, const char* name) {
    const auto& value = getMember(object, name);
    if(!value.IsString()) {
        auto message = boost::format("JSON member \"%s\" is not a string") % name;
        OCMIRROR_THROW_ERROR(message.str());
    }
    return std::string(value.GetString(), value.GetStringLength());
}

std::vector<std::string> getStringArray(const rapidjson::Value& object, const char* name) {
    const auto& value = getMember(object, name);
    if(!value.IsArray()) {
        auto message = boost::format("JSON member \"%s\" is not an array") % name;
        OCMIRROR_THROW_ERROR(message.str());
    }
    auto strings = std::vector<std::string>{};
    for(const auto& element : value.GetArray()) {
        if(!element.IsString()) {
            auto message = boost::format("JSON array \"%s\" contains a non-string element") % name;
            OCMIRROR_THROW_ERROR(message.str());
        }
        strings.emplace_back(element.GetString(), element.GetStringLength());
    }
    return strings;
}

}}
