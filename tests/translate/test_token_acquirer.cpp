#include <catch2/catch_test_macros.hpp>
#include "translate/TokenAcquirer.hpp"
#include "translate/TokenTransform.hpp"
#include "utils/ErrorReporter.hpp"
#include "../utils/mock_http.hpp"

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace translate;
using test_utils::MockHttpClient;
using test_utils::MockResponses;

namespace {

constexpr const char* kHostUrl = "https://translate.google.com/";

KeyPairStore::Clock fixed_clock() {
    return [] { return std::chrono::system_clock::time_point(std::chrono::hours(480000)); };
}

}  // namespace

TEST_CASE("Token acquirer", "[translate][token]") {
    utils::ErrorReporter::ClearErrors();
    auto http = std::make_shared<MockHttpClient>();

    SECTION("Uses the fetched key pair") {
        http->setResponse(kHostUrl, MockResponses::host_page("432558.706957580"));
        auto store = std::make_shared<KeyPairStore>(http, "translate.google.com", KeyPairSettings{},
                                                    utils::SessionConfig{}, fixed_clock());
        TokenAcquirer acquirer(store);

        REQUIRE(acquirer.derive("test") == "711583.803377");
        REQUIRE(acquirer.derive("") == token::deriveToken("", KeyPair{432558, 706957580}));
        REQUIRE(http->requestCount() == 1);
        REQUIRE(&acquirer.store() == store.get());
    }

    SECTION("Falls back to the synthetic pair") {
        http->setResponse(kHostUrl, MockResponses::error_status(500));
        auto store = std::make_shared<KeyPairStore>(http, "translate.google.com", KeyPairSettings{},
                                                    utils::SessionConfig{}, fixed_clock());
        TokenAcquirer acquirer(store);

        REQUIRE(acquirer.derive("test") == token::deriveToken("test", KeyPair{480000, 480000}));
    }

    SECTION("Shared between threads") {
        http->setResponse(kHostUrl, MockResponses::host_page("406398.2087938574"));
        http->setDelayMs(20);
        auto store = std::make_shared<KeyPairStore>(http, "translate.google.com", KeyPairSettings{},
                                                    utils::SessionConfig{}, fixed_clock());
        TokenAcquirer acquirer(store);

        std::vector<std::string> tokens(6);
        std::vector<std::thread> threads;
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            threads.emplace_back([&, i] { tokens[i] = acquirer.derive("Hello World!"); });
        }
        for (auto& t : threads) {
            t.join();
        }

        for (const auto& tk : tokens) {
            REQUIRE(tk == "644029.1040579");
        }
        REQUIRE(http->requestCount() == 1);
    }
}
