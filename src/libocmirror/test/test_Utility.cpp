/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <atomic>
#include <sstream>
#include <vector>
#include <string>

#include <boost/filesystem.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/PathRAII.hpp"
#include "libocmirror/Utility.hpp"
#include "test_utility/environment.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace libocmirror {
namespace test {

TEST_GROUP(UtilityTestGroup) {
};

TEST(UtilityTestGroup, sha256Digest) {
    CHECK_EQUAL(std::string{"sha256:e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"},
                digest::computeSha256(""));
    CHECK_EQUAL(std::string{"sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"},
                digest::computeSha256("abc"));
}

TEST(UtilityTestGroup, digestParts) {
    auto d = std::string{"sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"};
    CHECK(digest::isValid(d));
    CHECK_EQUAL(std::string{"sha256"}, digest::getAlgorithm(d));
    CHECK_EQUAL(std::string{"ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"}, digest::getHex(d));

    CHECK(!digest::isValid("sha256"));
    CHECK(!digest::isValid("sha256:xyz"));
    CHECK(!digest::isValid("latest"));
    CHECK_THROWS(Error, digest::getHex("not-a-digest"));
}

TEST(UtilityTestGroup, verifyContent) {
    digest::verifyContent("abc", "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    try {
        digest::verifyContent("abd", "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        FAIL("expected a digest mismatch");
    }
    catch(const Error& e) {
        CHECK(e.getKind() == ErrorKind::Transport);
    }
}

TEST(UtilityTestGroup, stringHelpers) {
    CHECK_EQUAL(std::string{"sha256=abc"}, string::replace("sha256:abc", ":", "="));
    CHECK_EQUAL(std::string{"aaa"}, string::replace("aaa", "", "b"));

    auto kv = string::parseKeyValuePair("ocs-operator:stable-4.8", ':');
    CHECK_EQUAL(std::string{"ocs-operator"}, kv.first);
    CHECK_EQUAL(std::string{"stable-4.8"}, kv.second);
    CHECK_EQUAL(std::string{""}, string::parseKeyValuePair("ocs-operator", ':').second);
    CHECK_THROWS(Error, string::parseKeyValuePair(":stable", ':'));

    auto tokens = string::splitWhitespaceSeparated("  a  b\nc\t ");
    CHECK_EQUAL(3, tokens.size());
    CHECK_EQUAL(std::string{"c"}, tokens[2]);
    CHECK(string::splitWhitespaceSeparated("   ").empty());

    CHECK_EQUAL(12, string::generateRandom(12).size());
}

TEST(UtilityTestGroup, environment) {
    test_utility::environment::setVariable("OCMIRROR_TEST_VARIABLE", "value");
    auto value = environment::lookupVariable("OCMIRROR_TEST_VARIABLE");
    CHECK(static_cast<bool>(value));
    CHECK_EQUAL(std::string{"value"}, *value);

    test_utility::environment::setVariable("OCMIRROR_TEST_VARIABLE", "");
    CHECK_EQUAL(std::string{""}, *environment::lookupVariable("OCMIRROR_TEST_VARIABLE"));

    test_utility::environment::unsetVariable("OCMIRROR_TEST_VARIABLE");
    CHECK(!environment::lookupVariable("OCMIRROR_TEST_VARIABLE"));
}

TEST(UtilityTestGroup, filesystemAndPathRAII) {
    auto tempDir = filesystem::makeTemporaryDirectory(boost::filesystem::temp_directory_path(), "ocmirror-test");
    {
        auto raii = PathRAII{tempDir};
        CHECK(boost::filesystem::is_directory(tempDir));
        CHECK((boost::filesystem::status(tempDir).permissions() & boost::filesystem::perms::all_all)
              == boost::filesystem::perms::owner_all);

        auto file = tempDir / "nested/dir/file.bin";
        auto content = std::string("binary\0content", 14);
        filesystem::writeFile(content, file);
        CHECK(filesystem::readFile(file) == content);

        auto moved = std::move(raii);
        CHECK(moved.getPath() == tempDir);
        CHECK_THROWS(Error, raii.getPath());
    }
    CHECK(!boost::filesystem::exists(tempDir));
    CHECK_THROWS(Error, filesystem::readFile(tempDir / "missing"));
}

TEST(UtilityTestGroup, jsonHelpers) {
    auto doc = json::parse(R"({"name":"ocs-operator","images":["a","b"],"count":2})");
    CHECK_EQUAL(std::string{"ocs-operator"}, json::getString(doc, "name"));
    CHECK_EQUAL(2, json::getStringArray(doc, "images").size());
    CHECK_THROWS(Error, json::getString(doc, "count"));
    CHECK_THROWS(Error, json::getMember(doc, "missing"));
    CHECK_THROWS(Error, json::parse("{not json"));
    CHECK_EQUAL(std::string{R"({"name":"ocs-operator","images":["a","b"],"count":2})"}, json::serialize(doc));
}

TEST(UtilityTestGroup, jsonSchemaValidation) {
    auto dir = PathRAII{filesystem::makeTemporaryDirectory(boost::filesystem::temp_directory_path(), "ocmirror-json")};
    auto schema = dir.getPath() / "schema.json";
    filesystem::writeFile(R"({"type":"object","properties":{"concurrency":{"type":"integer","minimum":1}},"required":["concurrency"]})",
                          schema);

    auto valid = dir.getPath() / "valid.json";
    filesystem::writeFile(R"({"concurrency": 4})", valid);
    CHECK_EQUAL(4, json::readAndValidate(valid, schema)["concurrency"].GetInt());

    auto invalid = dir.getPath() / "invalid.json";
    filesystem::writeFile(R"({"concurrency": 0})", invalid);
    CHECK_THROWS(Error, json::readAndValidate(invalid, schema));
}

TEST(UtilityTestGroup, forkExecWaitCapturesStdout) {
    auto output = std::stringstream{};
    auto status = process::forkExecWait(CLIArguments{"sh", "-c", "printf 'status line\\n'; exit 3"}, &output);
    CHECK_EQUAL(3, status);
    CHECK_EQUAL(std::string{"status line\n"}, output.str());
    CHECK_EQUAL(127, process::forkExecWait(CLIArguments{"/nonexistent/executable"}));
}

TEST(UtilityTestGroup, forEachIndexVisitsEveryIndex) {
    auto visited = std::vector<std::atomic<int>>(100);
    concurrency::forEachIndex(visited.size(), 4, [&](size_t i) {
        ++visited[i];
    });
    for(const auto& count : visited) {
        CHECK_EQUAL(1, count.load());
    }

    // no work and zero concurrency are both accepted
    auto calls = std::atomic<int>{0};
    concurrency::forEachIndex(0, 4, [&](size_t) { ++calls; });
    CHECK_EQUAL(0, calls.load());
    concurrency::forEachIndex(3, 0, [&](size_t) { ++calls; });
    CHECK_EQUAL(3, calls.load());
}

TEST(UtilityTestGroup, forEachIndexRethrowsFirstError) {
    auto started = std::atomic<int>{0};
    try {
        concurrency::forEachIndex(1000, 1, [&](size_t i) {
            ++started;
            if(i == 2) {
                OCMIRROR_THROW_ERROR("failure in worker");
            }
        });
        FAIL("Expected exception");
    }
    catch(const Error& e) {
        CHECK_EQUAL(std::string{"failure in worker"}, std::string{e.what()});
    }
    CHECK_EQUAL(3, started.load());
}

}}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
