/**
 * @file test_engine_protocol.cpp
 * @brief Tests for the engine wire format
 */

#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

import tondar.utils.engine_protocol;

namespace utils = tondar::utils;

namespace {

QJsonObject parse(const char* json) {
    QJsonObject out;
    EXPECT_TRUE(utils::parseMessage(QByteArray(json), &out));
    return out;
}

}  // namespace

// =============================================================================
// EVENTS
// =============================================================================

TEST(EngineProtocol, DecodesQueueEvent) {
    const QJsonObject msg = parse(R"({"event":"queue_download","payload":{
        "id":"a","url":"https://x/y.zip","filename":"y.zip","size":null,
        "destination":"/tmp","resume_supported":true,"status":"queued"}})");

    utils::EngineEvent event;
    ASSERT_TRUE(utils::decodeEvent(msg, &event));
    EXPECT_EQ(event.kind, utils::EngineEvent::Kind::Queued);
    EXPECT_EQ(event.queue.id, "a");
    EXPECT_EQ(event.queue.fileName, "y.zip");
    EXPECT_EQ(event.queue.size, -1);
    EXPECT_TRUE(event.queue.resumeSupported);
}

TEST(EngineProtocol, DecodesProgressEventWithSegments) {
    const QJsonObject msg = parse(R"({"event":"download_progress","payload":{
        "id":"a","downloaded":50,"total":100,"speed":10.5,"progress":49.6,
        "segments":[{"start":0,"end":50},{"start":"bad"}]}})");

    utils::EngineEvent event;
    ASSERT_TRUE(utils::decodeEvent(msg, &event));
    EXPECT_EQ(event.kind, utils::EngineEvent::Kind::Progress);
    EXPECT_EQ(event.progress.downloaded, 50);
    EXPECT_EQ(event.progress.total, 100);
    EXPECT_DOUBLE_EQ(event.progress.speed, 10.5);
    EXPECT_EQ(event.progress.progress, 50);
    ASSERT_EQ(event.progress.segments.size(), 1);
    EXPECT_EQ(event.progress.segments[0].end, 50);
}

TEST(EngineProtocol, OutOfRangeNumbersFallBackInsteadOfOverflowing) {
    const QJsonObject msg = parse(R"({"event":"download_progress","payload":{
        "id":"a","downloaded":1e20,"total":-1e300,"speed":1,"progress":1e12,
        "segments":[{"start":0,"end":1e15}]}})");

    utils::EngineEvent event;
    ASSERT_TRUE(utils::decodeEvent(msg, &event));
    EXPECT_EQ(event.progress.downloaded, 0);
    EXPECT_EQ(event.progress.total, 0);
    EXPECT_EQ(event.progress.progress, 100);
    ASSERT_EQ(event.progress.segments.size(), 1);
    EXPECT_EQ(event.progress.segments[0].end, 0);

    ASSERT_TRUE(utils::decodeEvent(parse(R"({"event":"download_progress","payload":{
        "id":"a","progress":-1e12}})"), &event));
    EXPECT_EQ(event.progress.progress, 0);

    ASSERT_TRUE(utils::decodeEvent(parse(R"({"event":"queue_download","payload":{
        "id":"a","size":1e20}})"), &event));
    EXPECT_EQ(event.queue.size, -1);
}

TEST(EngineProtocol, DecodesLifecycleEvents) {
    utils::EngineEvent event;

    ASSERT_TRUE(utils::decodeEvent(parse(R"({"event":"download_started","payload":{"id":"a"}})"), &event));
    EXPECT_EQ(event.kind, utils::EngineEvent::Kind::Started);

    ASSERT_TRUE(utils::decodeEvent(parse(R"({"event":"download_complete","payload":{"id":"a"}})"), &event));
    EXPECT_EQ(event.kind, utils::EngineEvent::Kind::Completed);

    ASSERT_TRUE(utils::decodeEvent(
        parse(R"({"event":"download_failed","payload":{"id":"a","error":"404"}})"), &event));
    EXPECT_EQ(event.kind, utils::EngineEvent::Kind::Failed);
    EXPECT_EQ(event.error, "404");
}

TEST(EngineProtocol, RejectsUnknownEventsAndMissingIds) {
    utils::EngineEvent event;
    QString error;

    EXPECT_FALSE(utils::decodeEvent(parse(R"({"event":"download_exploded","payload":{"id":"a"}})"), &event, &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(utils::decodeEvent(parse(R"({"event":"download_started","payload":{}})"), &event));
    EXPECT_FALSE(utils::decodeEvent(parse(R"({"event":"download_started"})"), &event));
}

// =============================================================================
// REQUESTS AND REPLIES
// =============================================================================

TEST(EngineProtocol, EncodesDownloadRequests) {
    const QJsonObject start = utils::encodeStartRequest(7, {"https://a", "https://b"});
    EXPECT_EQ(start.value("request").toInt(), 7);
    EXPECT_EQ(start.value("command").toString(), "handle_download_request");
    const QJsonObject inner = start.value("args").toObject().value("request").toObject();
    EXPECT_EQ(inner.value("type").toString(), "New");
    EXPECT_EQ(inner.value("data").toArray().size(), 2);

    const QJsonObject resume = utils::encodeResumeRequest(8, {"id1"});
    EXPECT_EQ(resume.value("args").toObject().value("request").toObject().value("type").toString(), "Resume");
}

TEST(EngineProtocol, EncodesIdRequests) {
    const QJsonObject pause = utils::encodePauseRequest(1, "a");
    EXPECT_EQ(pause.value("command").toString(), "pause_download");
    EXPECT_EQ(pause.value("args").toObject().value("id").toString(), "a");

    const QJsonObject cancel = utils::encodeCancelRequest(2, "b");
    EXPECT_EQ(cancel.value("command").toString(), "cancel_download");
}

TEST(EngineProtocol, FramesOneLinePerMessage) {
    const QByteArray line = utils::frameMessage(utils::encodePauseRequest(1, "a"));
    EXPECT_TRUE(line.endsWith('\n'));
    EXPECT_EQ(line.count('\n'), 1);
}

TEST(EngineProtocol, DecodesReplies) {
    const QJsonObject ok = parse(R"({"reply":3,"ok":true})");
    EXPECT_TRUE(utils::isReplyMessage(ok));
    EXPECT_FALSE(utils::isEventMessage(ok));

    utils::EngineReply reply;
    ASSERT_TRUE(utils::decodeReply(ok, &reply));
    EXPECT_EQ(reply.request, 3u);
    EXPECT_TRUE(reply.ok);

    ASSERT_TRUE(utils::decodeReply(parse(R"({"reply":4,"error":"nope"})"), &reply));
    EXPECT_FALSE(reply.ok);
    EXPECT_EQ(reply.error, "nope");

    EXPECT_FALSE(utils::decodeReply(parse(R"({"reply":"x"})"), &reply));
    EXPECT_FALSE(utils::decodeReply(parse(R"({"reply":1e30})"), &reply));
    EXPECT_FALSE(utils::decodeReply(parse(R"({"reply":2.5})"), &reply));
}

TEST(EngineProtocol, ParseRejectsNonObjects) {
    QJsonObject out;
    QString error;
    EXPECT_FALSE(utils::parseMessage("[1,2]", &out, &error));
    EXPECT_FALSE(utils::parseMessage("{oops", &out, &error));
    EXPECT_FALSE(error.isEmpty());
}
