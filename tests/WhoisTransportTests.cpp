#include <gtest/gtest.h>
#include <curl/curl.h>
#include "FakeWhoisServer.hpp"
#include "WhoisClient.hpp"

#include <chrono>

// Обмен по настоящему TCP с локальным сервером
class WhoisTransportTest : public ::testing::Test {
protected:
    static void SetUpTestSuite()    { curl_global_init(CURL_GLOBAL_ALL); }
    static void TearDownTestSuite() { curl_global_cleanup(); }

    static WhoisOptions localOptions(const FakeWhoisServer& server) {
        WhoisOptions opts;
        opts.port           = server.port();
        opts.rootServer     = "127.0.0.1";
        opts.timeoutSeconds = 5;
        opts.servers["com"] = "127.0.0.1";
        return opts;
    }

    static WhoisError::Kind lookupErrorKind(WhoisClient& client, const std::string& domain) {
        try {
            client.lookup(domain);
        } catch (const WhoisError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected WhoisError for " << domain;
        return WhoisError::Kind::Network;
    }
};

TEST_F(WhoisTransportTest, Lookup_RegisteredAnswerReturnedWhole) {
    FakeWhoisServer server([](const std::string& request) {
        return "Domain Name: " + request + "\r\nRegistrar: Example Registrar\r\n";
    });
    WhoisClient client(localOptions(server));

    std::string answer = client.lookup("example.com");

    EXPECT_EQ(answer, "Domain Name: example.com\r\nRegistrar: Example Registrar\r\n");
    EXPECT_EQ(server.requestCount("example.com"), 1);
}

TEST_F(WhoisTransportTest, Lookup_NoMatchAnswer_NoRecord) {
    FakeWhoisServer server([](const std::string& request) {
        return "No match for \"" + request + "\".\r\n>>> Last update of whois database\r\n";
    });
    WhoisClient client(localOptions(server));

    EXPECT_EQ(lookupErrorKind(client, "nonexistent-domain-12345.com"),
              WhoisError::Kind::NoRecord);
}

TEST_F(WhoisTransportTest, Lookup_OversizeAnswer_Protocol) {
    FakeWhoisServer server([](const std::string&) {
        return std::string(WhoisClient::kMaxResponseBytes + 4096, 'x');
    });
    WhoisClient client(localOptions(server));

    EXPECT_EQ(lookupErrorKind(client, "huge.com"), WhoisError::Kind::Protocol);
}

TEST_F(WhoisTransportTest, Lookup_SilentServer_Timeout) {
    FakeWhoisServer server([](const std::string&) { return std::string(); }, true);
    WhoisOptions opts = localOptions(server);
    opts.timeoutSeconds = 1;
    WhoisClient client(opts);

    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(lookupErrorKind(client, "slow.com"), WhoisError::Kind::Timeout);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::seconds(4));
}

TEST_F(WhoisTransportTest, ServerFor_ReferralQueriedOnceAndCached) {
    FakeWhoisServer server([](const std::string& request) -> std::string {
        if (request == "net")
            return "domain: NET\nwhois: 127.0.0.1\nrefer: 127.0.0.1\n";
        return "Domain Name: " + request + "\n";
    });
    WhoisOptions opts = localOptions(server);
    opts.servers.clear();
    WhoisClient client(opts);

    EXPECT_EQ(client.lookup("first.net"), "Domain Name: first.net\n");
    EXPECT_EQ(client.lookup("second.net"), "Domain Name: second.net\n");

    EXPECT_EQ(server.requestCount("net"), 1);
    EXPECT_EQ(server.requestCount("first.net"), 1);
    EXPECT_EQ(server.requestCount("second.net"), 1);
}

TEST_F(WhoisTransportTest, ServerFor_NoReferral_UnsupportedTld) {
    FakeWhoisServer server([](const std::string&) {
        return std::string("% This query returned 0 objects.\n");
    });
    WhoisOptions opts = localOptions(server);
    opts.servers.clear();
    WhoisClient client(opts);

    EXPECT_EQ(lookupErrorKind(client, "name.zzz"), WhoisError::Kind::UnsupportedTld);
}

TEST_F(WhoisTransportTest, Lookup_ProxyEnvironmentIgnored) {
    ::setenv("http_proxy", "http://127.0.0.1:9", 1);
    ::setenv("all_proxy", "http://127.0.0.1:9", 1);
    FakeWhoisServer server([](const std::string& request) {
        return "Domain Name: " + request + "\n";
    });
    WhoisClient client(localOptions(server));

    std::string answer;
    EXPECT_NO_THROW(answer = client.lookup("direct.com"));
    ::unsetenv("http_proxy");
    ::unsetenv("all_proxy");

    EXPECT_EQ(answer, "Domain Name: direct.com\n");
    EXPECT_EQ(server.requestCount("direct.com"), 1);
}
