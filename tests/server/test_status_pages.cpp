#include <gtest/gtest.h>
#include "mqttd/server/protocols/http/status_pages.h"
#include <nlohmann/json.hpp>

using namespace mqttd::server;
using namespace mqttd::server::protocols::http;

namespace {

broker::ClientSnapshot client(const std::string& id, const std::string& user, const std::string& listener) {
    broker::ClientSnapshot snapshot;
    snapshot.id = id;
    snapshot.username = user;
    snapshot.listener = listener;
    snapshot.remote = "192.168.1.20:51000";
    snapshot.protocolVersion = 5;
    return snapshot;
}

} // namespace

TEST(StatusPagesTest, TableSkipsTheInlineClient) {
    auto inlineClient = client("inline", "", "local");
    inlineClient.inlineClient = true;

    auto table = buildConnectionTable({client("c1", "alice", "mqtt"), inlineClient});
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.rows[0].clientId, "c1");
    EXPECT_EQ(table.total, 1u);
    EXPECT_EQ(table.listenerCounts, "mqtt: 1");
}

TEST(StatusPagesTest, RowsSortByUsernameThenClientId) {
    auto table = buildConnectionTable({
        client("z", "bob", "mqtt"),
        client("b", "alice", "ws"),
        client("a", "alice", "mqtt"),
    });

    ASSERT_EQ(table.rows.size(), 3u);
    EXPECT_EQ(table.rows[0].clientId, "a");
    EXPECT_EQ(table.rows[1].clientId, "b");
    EXPECT_EQ(table.rows[2].clientId, "z");
    EXPECT_EQ(table.listenerCounts, "mqtt: 2; ws: 1");
}

TEST(StatusPagesTest, SubscriptionsAreSortedAndCounted) {
    auto snapshot = client("c1", "alice", "mqtt");
    snapshot.subscriptions = {{"up/#", 1}, {"down/+/x", 0}, {"a/b", 2}};

    auto table = buildConnectionTable({snapshot});
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.rows[0].subscriptionCount, 3u);
    EXPECT_EQ(table.rows[0].subscriptions, "a/b\ndown/+/x\nup/#");
}

TEST(StatusPagesTest, PageEscapesClientValues) {
    auto table = buildConnectionTable({client("<script>", "o'neil", "mqtt")});
    StatusPageContext context{"2026-10-19 08:00:00", "1h 0m 0s", "mqtt: 0.0.0.0:1883"};

    auto html = renderConnectionsPage(table, context);
    EXPECT_NE(html.find("<meta http-equiv=\"refresh\" content=\"180\" />"), std::string::npos);
    EXPECT_NE(html.find("<title>Broker Information</title>"), std::string::npos);
    EXPECT_NE(html.find("<th>Subscribe Detail</th>"), std::string::npos);
    EXPECT_NE(html.find("&lt;script&gt;"), std::string::npos);
    EXPECT_NE(html.find("o&#39;neil"), std::string::npos);
    EXPECT_EQ(html.find("<script>"), std::string::npos);
    EXPECT_NE(html.find("1h 0m 0s"), std::string::npos);
    EXPECT_NE(html.find("<td>5</td>"), std::string::npos);
}

TEST(StatusPagesTest, InformationIsTabIndented) {
    broker::SystemInfo info;
    info.version = "1.0.0";
    info.clientsConnected = 3;

    auto text = renderInformation(info);
    EXPECT_EQ(text.rfind("{\n\t\"", 0), 0u);
    auto json = nlohmann::json::parse(text);
    EXPECT_EQ(json["clients_connected"], 3);
    EXPECT_EQ(json["version"], "1.0.0");
}

TEST(StatusPagesTest, RawDataHasOneDocumentPerClient) {
    auto first = client("c1", "alice", "mqtt");
    first.subscriptions = {{"a/#", 1}};
    auto text = renderClientsRawData({first, client("c2", "bob", "ws")});

    auto split = text.find("}\n{");
    ASSERT_NE(split, std::string::npos);
    auto one = nlohmann::json::parse(text.substr(0, split + 1));
    auto two = nlohmann::json::parse(text.substr(split + 2));
    EXPECT_EQ(one["id"], "c1");
    EXPECT_EQ(one["subscriptions"]["a/#"]["qos"], 1);
    EXPECT_EQ(two["id"], "c2");
    EXPECT_EQ(text.back(), '\n');

    EXPECT_EQ(renderClientsRawData({}), "");
}

TEST(StatusPagesTest, RawDataReplacesInvalidUtf8) {
    auto text = renderClientsRawData({client("bad\xff", "alice", "mqtt"), client("c2", "bob", "ws")});

    auto split = text.find("}\n{");
    ASSERT_NE(split, std::string::npos);
    auto one = nlohmann::json::parse(text.substr(0, split + 1));
    auto two = nlohmann::json::parse(text.substr(split + 2));
    EXPECT_EQ(one["id"], "bad\xEF\xBF\xBD");
    EXPECT_EQ(two["id"], "c2");
}

TEST(StatusPagesTest, InformationReplacesInvalidUtf8) {
    broker::SystemInfo info;
    info.version = "1.0\xc3";

    std::string text;
    ASSERT_NO_THROW(text = renderInformation(info));
    EXPECT_EQ(nlohmann::json::parse(text)["version"], "1.0\xEF\xBF\xBD");
}
