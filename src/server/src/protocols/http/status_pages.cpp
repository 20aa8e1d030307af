#include "mqttd/server/protocols/http/status_pages.h"
#include "mqttd/core/utils.h"
#include <algorithm>
#include <map>
#include <sstream>
#include <tuple>

namespace mqttd {
namespace server {
namespace protocols {
namespace http {

namespace {

const char* PAGE_HEAD = R"(<!DOCTYPE html>
<html lang="en">
<head>
    <meta content="text/html; charset=utf-8" http-equiv="content-type" />
    <meta http-equiv="refresh" content="180" />
    <title>Broker Information</title>
    <style type="text/css">
        a { color: #4183C4; font-size: 16px; }
        h3 { font-size: 18px; margin: 20px 0 10px; }
        table { padding: 0; border-collapse: collapse; }
        table tr { border-top: 1px solid #000000; background-color: #ffffff; }
        table tr:nth-child(2n) { background-color: #eeffee; }
        table tr th { font-weight: bold; background-color: #fffddd; border: 1px solid #cccccc; padding: 6px 13px; }
        table tr td { border: 1px solid #cccccc; text-align: center; padding: 6px 13px; }
        table tr td:nth-of-type(2) { text-align: left; }
        table tr td:nth-of-type(7) { text-align: left; width: 700px; white-space: pre-wrap; }
    </style>
</head>
)";

const char* COLUMNS[] = {"Client User", "Client ID", "Client IP", "Client Ver", "Protocol", "Subscribes",
                         "Subscribe Detail"};

} // namespace

ConnectionTable buildConnectionTable(const std::vector<broker::ClientSnapshot>& clients) {
    ConnectionTable table;
    std::map<std::string, size_t> counts;

    for (const auto& client : clients) {
        if (client.listener == "local" || client.id == "inline") {
            continue;
        }

        std::vector<std::string> filters;
        filters.reserve(client.subscriptions.size());
        for (const auto& sub : client.subscriptions) {
            filters.push_back(sub.first);
        }
        std::sort(filters.begin(), filters.end());

        ConnectionRow row;
        row.username = client.username;
        row.clientId = client.id;
        row.remote = client.remote;
        row.protocolVersion = client.protocolVersion;
        row.listener = client.listener;
        row.subscriptionCount = filters.size();
        row.subscriptions = core::string_utils::join(filters, "\n");
        table.rows.push_back(std::move(row));

        counts[client.listener]++;
    }

    std::sort(table.rows.begin(), table.rows.end(), [](const ConnectionRow& a, const ConnectionRow& b) {
        return std::tie(a.username, a.clientId) < std::tie(b.username, b.clientId);
    });

    std::vector<std::string> parts;
    for (const auto& count : counts) {
        parts.push_back(count.first + ": " + std::to_string(count.second));
    }
    table.listenerCounts = core::string_utils::join(parts, "; ");
    table.total = table.rows.size();
    return table;
}

std::string renderConnectionsPage(const ConnectionTable& table, const StatusPageContext& context) {
    using core::htmlEscape;

    std::ostringstream html;
    html << PAGE_HEAD;
    html << "<body>\n";
    html << "    <h3>Current Time:</h3><a>" << htmlEscape(context.currentTime) << "</a>\n";
    html << "    <h3>Uptime</h3><a>" << htmlEscape(context.uptime) << "</a>\n";
    html << "    <h3>Listeners:</h3><a>" << htmlEscape(context.listeners) << "</a>\n";
    html << "    <h3>Clients</h3><a>" << htmlEscape(table.listenerCounts) << "</a>\n";
    html << "    <table>\n        <thead>\n            <tr>\n";
    for (const char* column : COLUMNS) {
        html << "                <th>" << column << "</th>\n";
    }
    html << "            </tr>\n        </thead>\n        <tbody>\n";

    for (const auto& row : table.rows) {
        html << "            <tr>\n";
        html << "                <td>" << htmlEscape(row.username) << "</td>\n";
        html << "                <td>" << htmlEscape(row.clientId) << "</td>\n";
        html << "                <td>" << htmlEscape(row.remote) << "</td>\n";
        html << "                <td>" << row.protocolVersion << "</td>\n";
        html << "                <td>" << htmlEscape(row.listener) << "</td>\n";
        html << "                <td>" << row.subscriptionCount << "</td>\n";
        html << "                <td>" << htmlEscape(row.subscriptions) << "</td>\n";
        html << "            </tr>\n";
    }

    html << "        </tbody>\n    </table>\n</body>\n</html>\n";
    return html.str();
}

std::string renderInformation(const broker::SystemInfo& info) {
    nlohmann::json j = info;
    return j.dump(1, '\t', false, nlohmann::json::error_handler_t::replace);
}

std::string renderClientsRawData(const std::vector<broker::ClientSnapshot>& clients) {
    std::string out;
    for (const auto& client : clients) {
        nlohmann::json j = client;
        out += j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        out += "\n";
    }
    return out;
}

} // namespace http
} // namespace protocols
} // namespace server
} // namespace mqttd
