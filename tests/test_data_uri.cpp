#include <catch2/catch_test_macros.hpp>

#include "audio/data_uri.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return {s.begin(), s.end()};
}

} // namespace

TEST_CASE("datauri::base64", "[datauri]") {

    SECTION("Rfc4648Vectors") {
        REQUIRE(datauri::base64_encode(bytes_of("")) == "");
        REQUIRE(datauri::base64_encode(bytes_of("f")) == "Zg==");
        REQUIRE(datauri::base64_encode(bytes_of("fo")) == "Zm8=");
        REQUIRE(datauri::base64_encode(bytes_of("foo")) == "Zm9v");
        REQUIRE(datauri::base64_encode(bytes_of("foob")) == "Zm9vYg==");
        REQUIRE(datauri::base64_encode(bytes_of("fooba")) == "Zm9vYmE=");
        REQUIRE(datauri::base64_encode(bytes_of("foobar")) == "Zm9vYmFy");
    }

    SECTION("DecodeVectors") {
        REQUIRE(datauri::base64_decode("Zm9vYmE=").value() == bytes_of("fooba"));
        REQUIRE(datauri::base64_decode("Zg==").value() == bytes_of("f"));
        REQUIRE(datauri::base64_decode("").value().empty());
    }

    SECTION("DecodeRejectsMalformed") {
        REQUIRE_FALSE(datauri::base64_decode("Zg="));
        REQUIRE_FALSE(datauri::base64_decode("Z!=="));
        REQUIRE_FALSE(datauri::base64_decode("Zg==Zm8="));
        REQUIRE_FALSE(datauri::base64_decode("===="));
        REQUIRE_FALSE(datauri::base64_decode("Zm9v\nYmFy"));
    }
}

TEST_CASE("datauri::mime_type_for", "[datauri]") {
    REQUIRE(datauri::mime_type_for("mp3") == "audio/mpeg");
    REQUIRE(datauri::mime_type_for("wav") == "audio/wav");
    REQUIRE(datauri::mime_type_for("WAV") == "audio/wav");
    REQUIRE(datauri::mime_type_for("ogg") == "audio/ogg");
    REQUIRE(datauri::mime_type_for("flac") == "audio/flac");
    REQUIRE(datauri::mime_type_for("m4a") == "audio/mp4");
    REQUIRE(datauri::mime_type_for("aiff") == "application/octet-stream");
    REQUIRE(datauri::mime_type_for("") == "application/octet-stream");
}

TEST_CASE("datauri::encode/decode", "[datauri]") {

    SECTION("Format") {
        auto uri = datauri::encode(bytes_of("RIFF"), "audio/wav");
        REQUIRE(uri == "data:audio/wav;base64,UklGRg==");
    }

    SECTION("RoundTripAllByteValues") {
        std::vector<uint8_t> data;
        for (int i = 0; i < 256; ++i) data.push_back(static_cast<uint8_t>(i));
        data.push_back(0);
        data.push_back(0xff);

        auto decoded = datauri::decode(datauri::encode(data, "audio/ogg"));
        REQUIRE(decoded);
        REQUIRE(decoded->mime == "audio/ogg");
        REQUIRE(decoded->bytes == data);
    }

    SECTION("DecodeRejectsNonDataUri") {
        REQUIRE_FALSE(datauri::decode("https://example.com/a.wav"));
    }

    SECTION("DecodeRejectsMissingBase64Marker") {
        REQUIRE_FALSE(datauri::decode("data:text/plain,hello"));
    }

    SECTION("DecodeRejectsBadPayload") {
        REQUIRE_FALSE(datauri::decode("data:audio/wav;base64,@@@@"));
    }
}
