// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "util/error.hpp"

#include <string>
#include <system_error>

using namespace signage;

TEST_CASE("CoreError: carries code and message", "[error]") {
    CoreError err(ErrorCode::NotFound, "no such peer: 10.0.0.9:3000");
    REQUIRE(err.code() == ErrorCode::NotFound);
    REQUIRE(std::string(err.what()) == "no such peer: 10.0.0.9:3000");

    // Catchable as runtime_error
    try {
        throw CoreError(ErrorCode::ValidationError, "bad");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()) == "bad");
    }
}

TEST_CASE("CoreError: code names", "[error]") {
    REQUIRE(std::string(ErrorCodeName(ErrorCode::NotFound)) == "NotFound");
    REQUIRE(std::string(ErrorCodeName(ErrorCode::Unreachable)) == "Unreachable");
    REQUIRE(std::string(ErrorCodeName(ErrorCode::ValidationError)) == "ValidationError");
    REQUIRE(std::string(ErrorCodeName(ErrorCode::LifecycleError)) == "LifecycleError");
    REQUIRE(std::string(ErrorCodeName(ErrorCode::TransientIO)) == "TransientIO");

    REQUIRE(ParseErrorCode("NotFound") == ErrorCode::NotFound);
    REQUIRE(ParseErrorCode("LifecycleError") == ErrorCode::LifecycleError);
    REQUIRE_FALSE(ParseErrorCode("notfound").has_value());
    REQUIRE_FALSE(ParseErrorCode("").has_value());
}

TEST_CASE("Transient IO: EIO and EPIPE only", "[error]") {
    REQUIRE(IsTransientIOError(std::make_error_code(std::errc::io_error)));
    REQUIRE(IsTransientIOError(std::make_error_code(std::errc::broken_pipe)));
    REQUIRE_FALSE(IsTransientIOError(std::make_error_code(std::errc::permission_denied)));
    REQUIRE_FALSE(IsTransientIOError(std::error_code{}));

    SECTION("Exceptions") {
        REQUIRE(IsTransientIOError(std::system_error(std::make_error_code(std::errc::broken_pipe))));
        REQUIRE(IsTransientIOError(CoreError(ErrorCode::TransientIO, "stdout closed")));
        REQUIRE_FALSE(IsTransientIOError(CoreError(ErrorCode::LifecycleError, "init failed")));
        REQUIRE_FALSE(IsTransientIOError(std::runtime_error("EPIPE")));
    }
}
