//
// Created by Sanger Steel on 10/19/26.
//

#pragma once
#include <array>
#include <string>
#include <string_view>

// One captured HTTP exchange. All durations are milliseconds, and the seven
// phases are never negative.
struct TimingRecord {
    std::string url = "unknown";
    std::string method = "unknown";
    int status = 0;
    double total_time = 0;
    double blocked = 0;
    double dns = 0;
    double connect = 0;
    double send = 0;
    double wait = 0;
    double receive = 0;
    double ssl = 0;
};

enum Quantity {
    TOTAL_TIME,
    BLOCKED,
    DNS,
    CONNECT,
    SEND,
    WAIT,
    RECEIVE,
    SSL,
};

struct QuantityInfo {
    Quantity quantity;
    std::string_view key;
    std::string_view display_name;
    double TimingRecord::* field;
};

// Reporting order is the order of this table.
inline constexpr std::array<QuantityInfo, 8> Quantities = {{
    {TOTAL_TIME, "total_time", "Total Time", &TimingRecord::total_time},
    {BLOCKED, "blocked", "Blocked", &TimingRecord::blocked},
    {DNS, "dns", "DNS Lookup", &TimingRecord::dns},
    {CONNECT, "connect", "TCP Connect", &TimingRecord::connect},
    {SEND, "send", "Send Request", &TimingRecord::send},
    {WAIT, "wait", "Wait (TTFB)", &TimingRecord::wait},
    {RECEIVE, "receive", "Download", &TimingRecord::receive},
    {SSL, "ssl", "SSL/TLS", &TimingRecord::ssl},
}};

inline const QuantityInfo& quantity_info(Quantity quantity) {
    return Quantities[static_cast<size_t>(quantity)];
}

inline double quantity_value(const TimingRecord& record, Quantity quantity) {
    return record.*(quantity_info(quantity).field);
}
