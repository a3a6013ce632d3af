#include "gtest/gtest.h"
#include "metron/json.hh"
#include "metron/error.hh"
#include "metron/snapshot.hh"
#include <sstream>

using namespace metron;
using namespace std::chrono;

namespace {
snapshot sample() {
    snapshot s;
    s.name = "http_200";
    s.count = 12;
    s.rate_1m = 1.5;
    s.rate_15m = 0.25;
    s.host = "web1";
    s.timestamp = snapshot::time_point(seconds{1760860805}) + milliseconds{7};
    return s;
}
} // anon namespace

TEST(Json, LoadAndAccess) {
    json o = json::load("{\"a\": {\"b\": [1, 2.5, \"x\"]}, \"s\": \"str\"}");
    ASSERT_TRUE(o.is_object());
    EXPECT_EQ(2u, o.osize());
    EXPECT_EQ("str", o.get("s").str());
    json b = o.get("a").get("b");
    ASSERT_TRUE(b.is_array());
    EXPECT_EQ(3u, b.asize());
    EXPECT_EQ(1, b.at(0).integer());
    EXPECT_DOUBLE_EQ(2.5, b.at(1).real());
    EXPECT_EQ("x", b.at(2).str());
    EXPECT_FALSE(o.get("missing"));
}

TEST(Json, LoadRejectsGarbage) {
    EXPECT_THROW(json::load("{\"unterminated\": "), errorx);
    EXPECT_THROW(json::load(""), errorx);
}

TEST(Json, BuildAndDump) {
    json j = json::object();
    j.set("n", json(3));
    j.set("list", json::array({json("a"), json(true)}));
    EXPECT_EQ(json::load("{\"n\": 3, \"list\": [\"a\", true]}"), j);
    EXPECT_EQ(j, json::load(j.dump()));
}

TEST(Snapshot, FormatTimestamp) {
    EXPECT_EQ("2025-10-19T08:00:05.007Z", format_timestamp(sample().timestamp));
    EXPECT_EQ("1970-01-01T00:00:00.000Z", format_timestamp(snapshot::time_point()));
}

TEST(Snapshot, ToJson) {
    const json j = to_json(sample());
    EXPECT_EQ("metric", j.get("message").str());
    EXPECT_EQ("http_200", j.get("name").str());
    EXPECT_EQ(12, j.get("count").integer());
    EXPECT_DOUBLE_EQ(1.5, j.get("rate_1m").real());
    EXPECT_FALSE(j.get("rate_5m"));
    EXPECT_DOUBLE_EQ(0.25, j.get("rate_15m").real());
    EXPECT_EQ("web1", j.get("host").str());
    EXPECT_EQ("2025-10-19T08:00:05.007Z", j.get("@timestamp").str());
    EXPECT_FALSE(j.get("tags"));
}

TEST(Snapshot, Tags) {
    snapshot s = sample();
    s.tags = {"metric"};
    const json j = to_json(s);
    ASSERT_TRUE(j.get("tags").is_array());
    EXPECT_EQ("metric", j.get("tags").at(0).str());
}

TEST(Snapshot, WithReading) {
    snapshot proto;
    proto.host = "h";
    meter_reading r;
    r.count = 4;
    r.rates[window_slot(5)] = 2.0;
    const snapshot s = proto.with("k", r);
    EXPECT_EQ("k", s.name);
    EXPECT_EQ("h", s.host);
    EXPECT_EQ(4u, s.count);
    EXPECT_FALSE(s.rate_1m);
    ASSERT_TRUE(s.rate_5m);
    EXPECT_DOUBLE_EQ(2.0, *s.rate_5m);
}

TEST(Snapshot, StreamSinkWritesLines) {
    std::ostringstream os;
    stream_sink sink(os);
    sink.emit(sample());
    snapshot second = sample();
    second.name = "http_404";
    sink.emit(second);

    std::istringstream is(os.str());
    std::string line;
    ASSERT_TRUE(std::getline(is, line));
    EXPECT_EQ("http_200", json::load(line).get("name").str());
    ASSERT_TRUE(std::getline(is, line));
    EXPECT_EQ("http_404", json::load(line).get("name").str());
    EXPECT_FALSE(std::getline(is, line));
}

TEST(Snapshot, StreamSinkBadStream) {
    std::ostringstream os;
    os.setstate(std::ios::badbit);
    stream_sink sink(os);
    EXPECT_THROW(sink.emit(sample()), errorx);
}
