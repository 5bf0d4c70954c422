#include <catch2/catch_test_macros.hpp>
#include "translate/TokenTransform.hpp"

#include <random>
#include <set>
#include <string>

using namespace translate;
using namespace translate::token;

namespace {

bool is_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

}  // namespace

TEST_CASE("Token transform known values", "[translate][token]") {

    SECTION("Zero key pair") {
        REQUIRE(deriveToken("", KeyPair{0, 0}) == "0.0");
        REQUIRE(deriveToken("a", KeyPair{0, 0}) == "50242.50242");
        REQUIRE(deriveToken("test", KeyPair{0, 0}) == "684737.684737");
    }

    SECTION("Fetched-looking key pairs") {
        REQUIRE(deriveToken("test", KeyPair{432558, 706957580}) == "711583.803377");
        REQUIRE(deriveToken("Hello World!", KeyPair{406398, 2087938574}) == "644029.1040579");
    }

    SECTION("Multi-byte UTF-8 input") {
        REQUIRE(deriveToken("你好，世界！", KeyPair{406398, 2087938574}) == "782319.908433");
    }

    SECTION("Characters outside the BMP count as surrogate pairs") {
        REQUIRE(deriveToken("\xF0\x9F\x98\x80", KeyPair{406398, 2087938574}) == "53787.450917");
    }

    SECTION("Negative seed keeps the second field unsigned") {
        REQUIRE(deriveToken("test", KeyPair{-5, 7}) == "730924.4294236375");
    }

    SECTION("Only the low 32 bits of the pair are used") {
        REQUIRE(deriveToken("hello", KeyPair{(std::int64_t{1} << 33) + 5, 3}) == "856094.856091");
        REQUIRE(deriveToken("test", KeyPair{(std::int64_t{1} << 32) + 432558, 706957580}) ==
                deriveToken("test", KeyPair{432558, 706957580}));
    }
}

TEST_CASE("Token transform properties", "[translate][token]") {
    const KeyPair pair{406398, 2087938574};

    SECTION("Token is two unsigned decimals joined by a dot") {
        for (const std::string text : {"", "a", "Hello", "こんにちは", "long text with spaces and punctuation!?"}) {
            const std::string tk = deriveToken(text, pair);
            const auto dot = tk.find('.');
            REQUIRE(dot != std::string::npos);
            REQUIRE(tk.find('.', dot + 1) == std::string::npos);
            const std::string first = tk.substr(0, dot);
            REQUIRE(is_digits(first));
            REQUIRE(is_digits(tk.substr(dot + 1)));
            REQUIRE(std::stoul(first) < kTokenModulus);
        }
    }

    SECTION("Deterministic for the same text and pair") {
        REQUIRE(deriveToken("repeatable", pair) == deriveToken("repeatable", pair));
    }

    SECTION("Second field is the first XOR the seed") {
        const std::string tk = deriveToken("xor check", pair);
        const auto dot = tk.find('.');
        const unsigned long n = std::stoul(tk.substr(0, dot));
        const unsigned long second = std::stoul(tk.substr(dot + 1));
        REQUIRE(second == (n ^ 406398UL));
    }

    SECTION("Different text or pair changes the token") {
        REQUIRE(deriveToken("hello", pair) != deriveToken("hellp", pair));
        REQUIRE(deriveToken("hello", pair) != deriveToken("hello", KeyPair{406399, 2087938574}));
        REQUIRE(deriveToken("hello", pair) != deriveToken("hello", KeyPair{406398, 2087938575}));
    }
}

TEST_CASE("Token transform over random samples", "[translate][token]") {
    std::mt19937 rng(20240611);
    std::uniform_int_distribution<int> len_dist(1, 40);
    std::uniform_int_distribution<int> char_dist(0x20, 0x7E);

    SECTION("Distinct texts rarely collide") {
        const KeyPair pair{432558, 706957580};
        std::set<std::string> texts;
        std::set<std::string> tokens;
        while (texts.size() < 500) {
            std::string text(static_cast<std::size_t>(len_dist(rng)), ' ');
            for (auto& c : text) c = static_cast<char>(char_dist(rng));
            if (texts.insert(text).second) {
                tokens.insert(deriveToken(text, pair));
            }
        }
        REQUIRE(tokens.size() >= 495);
    }

    SECTION("Distinct pairs rarely collide") {
        std::uniform_int_distribution<std::int64_t> key_dist(0, 0xFFFFFFFF);
        std::set<std::string> tokens;
        for (int i = 0; i < 500; ++i) {
            tokens.insert(deriveToken("fixed text", KeyPair{key_dist(rng), key_dist(rng)}));
        }
        REQUIRE(tokens.size() >= 495);
    }
}

TEST_CASE("UTF-16 code unit expansion", "[translate][token]") {

    SECTION("ASCII maps one to one") {
        auto units = toCodeUnits("Hi!");
        REQUIRE(units == std::vector<std::uint16_t>{'H', 'i', '!'});
    }

    SECTION("BMP characters take one unit") {
        auto units = toCodeUnits("\xE4\xBD\xA0");  // 你
        REQUIRE(units == std::vector<std::uint16_t>{0x4F60});
    }

    SECTION("Supplementary characters take two units") {
        auto units = toCodeUnits("\xF0\x9F\x98\x80");  // U+1F600
        REQUIRE(units == std::vector<std::uint16_t>{0xD83D, 0xDE00});
    }

    SECTION("Malformed bytes become replacement characters") {
        REQUIRE(toCodeUnits("\xFF") == std::vector<std::uint16_t>{0xFFFD});
        REQUIRE(toCodeUnits("a\xFF\xFE" "b") == std::vector<std::uint16_t>{'a', 0xFFFD, 0xFFFD, 'b'});
        REQUIRE(deriveToken("\xFF", KeyPair{406398, 2087938574}) == "238124.364882");
        REQUIRE(deriveToken("\xFF\xFE", KeyPair{406398, 2087938574}) == "844548.708730");
    }

    SECTION("Units path matches the text path") {
        const KeyPair pair{432558, 706957580};
        REQUIRE(deriveTokenFromUnits(toCodeUnits("test"), pair) == deriveToken("test", pair));
    }
}

TEST_CASE("Mix programs", "[translate][token]") {

    SECTION("Zero stays zero") {
        REQUIRE(mix(0, kLoopProgram) == 0);
        REQUIRE(mix(0, kFinalProgram) == 0);
    }

    SECTION("Known single-step results") {
        REQUIRE(mix(1, kLoopProgram) == 1041u);
        REQUIRE(mix(1, kFinalProgram) == 294921u);
    }

    SECTION("Left shifts wrap at 32 bits") {
        // 0x80000000 + (0x80000000 << 10) keeps the top bit only
        REQUIRE(mix(0x80000000u, "+-a") == 0x80000000u);
    }

    SECTION("Incomplete triples are ignored") {
        REQUIRE(mix(12345, "") == 12345u);
        REQUIRE(mix(12345, "+-") == 12345u);
        REQUIRE(mix(12345, nullptr) == 12345u);
    }
}
