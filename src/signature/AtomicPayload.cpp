/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "signature/AtomicPayload.hpp"

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/json.hpp"


namespace ocmirror {
namespace signature {

const std::string AtomicPayload::TYPE{"atomic container signature"};

std::string AtomicPayload::serialize() const {
    namespace rj = rapidjson;
    auto json = rj::Document{rj::kObjectType};
    auto& allocator = json.GetAllocator();

    auto identity = rj::Value{rj::kObjectType};
    identity.AddMember("docker-reference", rj::Value{dockerReference.c_str(), allocator}, allocator);

    auto image = rj::Value{rj::kObjectType};
    image.AddMember("docker-manifest-digest", rj::Value{manifestDigest.c_str(), allocator}, allocator);

    auto critical = rj::Value{rj::kObjectType};
    critical.AddMember("identity", identity, allocator);
    critical.AddMember("image", image, allocator);
    critical.AddMember("type", rj::Value{TYPE.c_str(), allocator}, allocator);

    auto optional = rj::Value{rj::kObjectType};
    if(!creator.empty()) {
        optional.AddMember("creator", rj::Value{creator.c_str(), allocator}, allocator);
    }
    if(timestamp) {
        optional.AddMember("timestamp", rj::Value{*timestamp}, allocator);
    }

    json.AddMember("critical", critical, allocator);
    json.AddMember("optional", optional, allocator);

    return libocmirror::json::serialize(json);
}

AtomicPayload AtomicPayload::parse(const std::string& document) {
    auto payload = AtomicPayload{};
    try {
        auto json = libocmirror::json::parse(document);
        const auto& critical = libocmirror::json::getMember(json, "critical");

        auto type = libocmirror::json::getString(critical, "type");
        if(type != TYPE) {
            auto message = boost::format("Unexpected signature type \"%s\"") % type;
            OCMIRROR_THROW_ERROR(message.str());
        }

        payload.manifestDigest = libocmirror::json::getString(libocmirror::json::getMember(critical, "image"),
                                                              "docker-manifest-digest");
        payload.dockerReference = libocmirror::json::getString(libocmirror::json::getMember(critical, "identity"),
                                                               "docker-reference");

        auto optional = json.FindMember("optional");
        if(optional != json.MemberEnd() && optional->value.IsObject()) {
            const auto& value = optional->value;
            if(value.HasMember("creator") && value["creator"].IsString()) {
                payload.creator = value["creator"].GetString();
            }
            if(value.HasMember("timestamp") && value["timestamp"].IsInt64()) {
                payload.timestamp = value["timestamp"].GetInt64();
            }
        }
    }
    catch(libocmirror::Error& e) {
        OCMIRROR_RETHROW_ERROR(e, "Failed to parse atomic signature payload");
    }
    return payload;
}

}
}
