#include <gtest/gtest.h>
#include "WhoisClient.hpp"

TEST(WhoisClientTest, TldOf) {
    EXPECT_EQ(WhoisClient::tldOf("example.com"), "com");
    EXPECT_EQ(WhoisClient::tldOf("Example.CO.UK"), "uk");
    EXPECT_EQ(WhoisClient::tldOf("trailing.org."), "org");
    EXPECT_EQ(WhoisClient::tldOf("localhost"), "");
    EXPECT_EQ(WhoisClient::tldOf("dot."), "");
}

TEST(WhoisClientTest, ParseReferral_IanaAnswer) {
    const std::string iana =
        "% IANA WHOIS server\r\n"
        "% for more information on IANA, visit http://www.iana.org\r\n"
        "\r\n"
        "domain:       COM\r\n"
        "\r\n"
        "organisation: VeriSign Global Registry Services\r\n"
        "whois:        whois.verisign-grs.com\r\n"
        "refer:        whois.verisign-grs.com\r\n"
        "status:       ACTIVE\r\n";

    EXPECT_EQ(WhoisClient::parseReferral(iana), "whois.verisign-grs.com");
}

TEST(WhoisClientTest, ParseReferral_PrefersReferOverWhois) {
    EXPECT_EQ(WhoisClient::parseReferral("whois: a.example\nrefer: b.example\n"), "b.example");
    EXPECT_EQ(WhoisClient::parseReferral("WHOIS:   c.example  \n"), "c.example");
}

TEST(WhoisClientTest, ParseReferral_NoServer_Empty) {
    EXPECT_EQ(WhoisClient::parseReferral("% This query returned 0 objects.\n"), "");
    EXPECT_EQ(WhoisClient::parseReferral("whois:\n"), "");
    EXPECT_EQ(WhoisClient::parseReferral(""), "");
}

TEST(WhoisClientTest, LooksUnregistered_KnownMarkers) {
    EXPECT_TRUE(WhoisClient::looksUnregistered(
        "No match for \"NONEXISTENT-DOMAIN-12345.COM\".\r\n>>> Last update of whois database"));
    EXPECT_TRUE(WhoisClient::looksUnregistered("%% NOT FOUND\n"));
    EXPECT_TRUE(WhoisClient::looksUnregistered("Domain: foo.de\nStatus: free\n"));
    EXPECT_TRUE(WhoisClient::looksUnregistered("  No entries found for the selected source(s).\n"));
    EXPECT_TRUE(WhoisClient::looksUnregistered("Domain not found.\n"));
}

TEST(WhoisClientTest, LooksUnregistered_RegisteredOrEmptyResponse) {
    const std::string registered =
        "   Domain Name: EXAMPLE.COM\r\n"
        "   Registry Domain ID: 2336799_DOMAIN_COM-VRSN\r\n"
        "   Registrar WHOIS Server: whois.iana.org\r\n"
        "   Domain Status: clientDeleteProhibited\r\n";

    EXPECT_FALSE(WhoisClient::looksUnregistered(registered));
    EXPECT_FALSE(WhoisClient::looksUnregistered(""));
    EXPECT_FALSE(WhoisClient::looksUnregistered("garbage \x01\x02 without markers"));
}

TEST(WhoisClientTest, ServerFor_OverrideSkipsReferral) {
    WhoisOptions opts;
    opts.rootServer = "root.invalid";
    opts.servers["COM"] = "whois.verisign-grs.com";
    WhoisClient client(opts);

    EXPECT_EQ(client.serverFor("com"), "whois.verisign-grs.com");
    EXPECT_EQ(client.serverFor("Com"), "whois.verisign-grs.com");
}

TEST(WhoisClientTest, Lookup_NoTld_UnsupportedTld) {
    WhoisClient client(WhoisOptions{});

    try {
        client.lookup("localhost");
        FAIL() << "expected WhoisError";
    } catch (const WhoisError& e) {
        EXPECT_EQ(e.kind(), WhoisError::Kind::UnsupportedTld);
    }
}

TEST(WhoisClientTest, ErrorKindNames) {
    EXPECT_STREQ(whoisErrorKindName(WhoisError::Kind::Network), "network");
    EXPECT_STREQ(whoisErrorKindName(WhoisError::Kind::Timeout), "timeout");
    EXPECT_STREQ(whoisErrorKindName(WhoisError::Kind::NoRecord), "no-record");
}
