// =============================================================================
// Qdrant REST Client Tests
// =============================================================================

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <boost/json.hpp>
#include <memory>
#include <string>
#include <vector>
#include "engram/error.hpp"
#include "engram/qdrant_client.hpp"
#include "mock_http_client.hpp"

using namespace engram;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Eq;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::SetArgReferee;
using ::testing::StrEq;
namespace json = boost::json;

class QdrantClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.host = "localhost";
        config_.port = 6333;
        mock_http_client_ = std::make_shared<MockHttpClient>();
        client_ = std::make_unique<QdrantClient>(mock_http_client_, config_);
    }

    void TearDown() override {}

    void expectRequest(const char* method, const std::string& target,
                       const std::string& response, unsigned status = 200) {
        EXPECT_CALL(*mock_http_client_, send_request(
            StrEq(method), StrEq(target), _, _, StrEq("localhost"), Eq(6333)))
            .WillOnce(DoAll(SetArgReferee<3>(response), Return(status)));
    }

    ServiceConfig config_;
    std::shared_ptr<MockHttpClient> mock_http_client_;
    std::unique_ptr<QdrantClient> client_;
};

TEST_F(QdrantClientTest, CollectionExistsTrueOn200) {
    expectRequest("GET", "/collections/thoughts", R"({"result":{"status":"green"},"status":"ok"})");
    EXPECT_TRUE(client_->collection_exists("thoughts"));
}

TEST_F(QdrantClientTest, CollectionExistsFalseOn404) {
    expectRequest("GET", "/collections/missing",
                  R"({"status":{"error":"Not found: Collection `missing` doesn't exist!"}})", 404);
    EXPECT_FALSE(client_->collection_exists("missing"));
}

TEST_F(QdrantClientTest, CreateCollectionSendsSizeAndDistance) {
    std::string body;
    EXPECT_CALL(*mock_http_client_, send_request(StrEq("PUT"), StrEq("/collections/thoughts"), _, _, _, _))
        .WillOnce(DoAll(SaveArg<2>(&body),
                        SetArgReferee<3>(std::string(R"({"result":true,"status":"ok"})")),
                        Return(200u)));

    client_->create_collection("thoughts", 768, Distance::COSINE);

    json::value sent = json::parse(body);
    EXPECT_EQ(sent.at("vectors").at("size").to_number<uint64_t>(), 768u);
    EXPECT_EQ(sent.at("vectors").at("distance").as_string(), "Cosine");
}

TEST_F(QdrantClientTest, DeleteMissingCollectionReturnsFalse) {
    expectRequest("DELETE", "/collections/gone", R"({"status":{"error":"Not found"}})", 404);
    EXPECT_FALSE(client_->delete_collection("gone"));
}

TEST_F(QdrantClientTest, ServerErrorIsBackendUnavailable) {
    expectRequest("GET", "/collections", R"({"status":{"error":"Service overloaded"}})", 503);
    try {
        client_->list_collections();
        FAIL() << "Expected BackendUnavailableError";
    } catch (const BackendUnavailableError& e) {
        EXPECT_NE(std::string(e.what()).find("Service overloaded"), std::string::npos);
    }
}

TEST_F(QdrantClientTest, PointOperationOn404IsCollectionNotFound) {
    expectRequest("POST", "/collections/thoughts/points/scroll", R"({"status":{"error":"Not found"}})", 404);
    try {
        client_->scroll("thoughts", PointFilter{}, 10);
        FAIL() << "Expected CollectionNotFoundError";
    } catch (const CollectionNotFoundError& e) {
        EXPECT_EQ(e.collection(), "thoughts");
    }
}

TEST_F(QdrantClientTest, MalformedJsonIsBackendUnavailable) {
    expectRequest("GET", "/collections", "<html>gateway</html>");
    EXPECT_THROW(client_->list_collections(), BackendUnavailableError);
}

TEST_F(QdrantClientTest, ListCollections) {
    expectRequest("GET", "/collections",
                  R"({"result":{"collections":[{"name":"a"},{"name":"b"}]},"status":"ok"})");
    EXPECT_EQ(client_->list_collections(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(QdrantClientTest, CollectionInfoParsesVectorParams) {
    expectRequest("GET", "/collections/skills", R"({
        "result": {
            "status": "yellow",
            "points_count": 42,
            "config": {"params": {"vectors": {"size": 1536, "distance": "Dot"}}}
        },
        "status": "ok"
    })");

    auto info = client_->get_collection_info("skills");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->name, "skills");
    EXPECT_EQ(info->status, CollectionStatus::YELLOW);
    EXPECT_EQ(info->points_count, 42u);
    EXPECT_EQ(info->vector_size, 1536u);
    EXPECT_EQ(info->distance, Distance::DOT);
}

TEST_F(QdrantClientTest, CollectionInfoHandlesNamedVectors) {
    expectRequest("GET", "/collections/multi", R"({
        "result": {
            "status": "green",
            "points_count": null,
            "config": {"params": {"vectors": {"text": {"size": 384, "distance": "Euclid"}}}}
        }
    })");

    auto info = client_->get_collection_info("multi");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->points_count, 0u);
    EXPECT_EQ(info->vector_size, 384u);
    EXPECT_EQ(info->distance, Distance::EUCLID);
}

TEST_F(QdrantClientTest, UpsertSendsPointsAndWaits) {
    std::string body;
    EXPECT_CALL(*mock_http_client_, send_request(
        StrEq("PUT"), StrEq("/collections/thoughts/points?wait=true"), _, _, _, _))
        .WillOnce(DoAll(SaveArg<2>(&body),
                        SetArgReferee<3>(std::string(R"({"result":{"status":"completed"}})")),
                        Return(200u)));

    Point point;
    point.id = "0b7c2f7e-4d7e-4c55-9d61-9a0c1f2b3e44";
    point.vector = {0.5f, 0.25f};
    point.payload["content"] = "hello";
    client_->upsert("thoughts", {point});

    json::value sent = json::parse(body);
    const auto& points = sent.at("points").as_array();
    ASSERT_EQ(points.size(), 1u);
    EXPECT_EQ(points[0].at("id").as_string(), "0b7c2f7e-4d7e-4c55-9d61-9a0c1f2b3e44");
    EXPECT_EQ(points[0].at("vector").as_array().size(), 2u);
    EXPECT_EQ(points[0].at("payload").at("content").as_string(), "hello");
}

TEST_F(QdrantClientTest, EmptyUpsertSendsNothing) {
    EXPECT_CALL(*mock_http_client_, send_request(_, _, _, _, _, _)).Times(0);
    client_->upsert("thoughts", {});
}

TEST_F(QdrantClientTest, ScrollSendsFilterAndReturnsNextOffset) {
    std::string body;
    EXPECT_CALL(*mock_http_client_, send_request(
        StrEq("POST"), StrEq("/collections/thoughts/points/scroll"), _, _, _, _))
        .WillOnce(DoAll(SaveArg<2>(&body),
                        SetArgReferee<3>(std::string(R"({
                            "result": {
                                "points": [{"id": 7, "payload": {"session_id": "s"}}],
                                "next_page_offset": "0b7c2f7e-4d7e-4c55-9d61-9a0c1f2b3e44"
                            }
                        })")),
                        Return(200u)));

    ScrollPage page = client_->scroll("thoughts", PointFilter::field_equals("session_id", "s"), 1);

    json::value sent = json::parse(body);
    EXPECT_EQ(sent.at("limit").to_number<int>(), 1);
    EXPECT_FALSE(sent.at("with_vector").as_bool());
    const auto& must = sent.at("filter").at("must").as_array();
    ASSERT_EQ(must.size(), 1u);
    EXPECT_EQ(must[0].at("key").as_string(), "session_id");
    EXPECT_EQ(must[0].at("match").at("value").as_string(), "s");

    ASSERT_EQ(page.points.size(), 1u);
    EXPECT_EQ(page.points[0].id, "7");
    EXPECT_EQ(page.next_offset, std::optional<std::string>("0b7c2f7e-4d7e-4c55-9d61-9a0c1f2b3e44"));
}

TEST_F(QdrantClientTest, SearchParsesScoredPoints) {
    std::string body;
    EXPECT_CALL(*mock_http_client_, send_request(
        StrEq("POST"), StrEq("/collections/thoughts/points/search"), _, _, _, _))
        .WillOnce(DoAll(SaveArg<2>(&body),
                        SetArgReferee<3>(std::string(R"({
                            "result": [{"id": "a", "score": 0.9, "payload": {"content": "x"}}]
                        })")),
                        Return(200u)));

    auto hits = client_->search("thoughts", {1.0f, 0.0f}, PointFilter{}, 5, 0.5);

    json::value sent = json::parse(body);
    EXPECT_TRUE(sent.at("with_payload").as_bool());
    EXPECT_DOUBLE_EQ(sent.at("score_threshold").as_double(), 0.5);
    EXPECT_FALSE(sent.as_object().contains("filter"));

    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].id, "a");
    EXPECT_DOUBLE_EQ(hits[0].score, 0.9);
}

TEST_F(QdrantClientTest, SearchHitWithoutIdIsBackendUnavailable) {
    expectRequest("POST", "/collections/thoughts/points/search",
                  R"({"result": [{"score": 0.9, "payload": {}}]})");
    EXPECT_THROW(client_->search("thoughts", {1.0f}, PointFilter{}, 5, std::nullopt),
                 BackendUnavailableError);
}

TEST_F(QdrantClientTest, NonNumericScoreIsBackendUnavailable) {
    expectRequest("POST", "/collections/thoughts/points/search",
                  R"({"result": [{"id": "a", "score": "high", "payload": {}}]})");
    EXPECT_THROW(client_->search("thoughts", {1.0f}, PointFilter{}, 5, std::nullopt),
                 BackendUnavailableError);
}

TEST_F(QdrantClientTest, OverflowingNumericIdIsBackendUnavailable) {
    expectRequest("POST", "/collections/thoughts/points/scroll",
                  R"({"result": {"points": [{"id": 99999999999999999999, "payload": {}}]}})");
    EXPECT_THROW(client_->scroll("thoughts", PointFilter{}, 10), BackendUnavailableError);
}

TEST_F(QdrantClientTest, NegativeCountIsBackendUnavailable) {
    expectRequest("POST", "/collections/thoughts/points/count", R"({"result":{"count":-3}})");
    EXPECT_THROW(client_->count("thoughts", PointFilter{}), BackendUnavailableError);
}

TEST_F(QdrantClientTest, DeleteByIdsSendsPointList) {
    std::string body;
    EXPECT_CALL(*mock_http_client_, send_request(
        StrEq("POST"), StrEq("/collections/thoughts/points/delete?wait=true"), _, _, _, _))
        .WillOnce(DoAll(SaveArg<2>(&body),
                        SetArgReferee<3>(std::string(R"({"result":{"status":"completed"}})")),
                        Return(200u)));

    client_->delete_points("thoughts", std::vector<std::string>{
        "0b7c2f7e-4d7e-4c55-9d61-9a0c1f2b3e44", "42"});

    json::value sent = json::parse(body);
    EXPECT_FALSE(sent.as_object().contains("filter"));
    const auto& points = sent.at("points").as_array();
    ASSERT_EQ(points.size(), 2u);
    EXPECT_EQ(points[0].as_string(), "0b7c2f7e-4d7e-4c55-9d61-9a0c1f2b3e44");
    EXPECT_EQ(points[1].to_number<uint64_t>(), 42u);
}

TEST_F(QdrantClientTest, DeleteByNoIdsSendsNothing) {
    EXPECT_CALL(*mock_http_client_, send_request(_, _, _, _, _, _)).Times(0);
    client_->delete_points("thoughts", std::vector<std::string>{});
}

TEST_F(QdrantClientTest, OutOfRangeNumericIdRejectedBeforeSending) {
    EXPECT_CALL(*mock_http_client_, send_request(_, _, _, _, _, _)).Times(0);
    EXPECT_THROW(client_->delete_points("thoughts", std::vector<std::string>{"99999999999999999999"}),
                 InvalidArgumentError);
}

TEST_F(QdrantClientTest, DeleteByEmptyFilterRejected) {
    EXPECT_CALL(*mock_http_client_, send_request(_, _, _, _, _, _)).Times(0);
    EXPECT_THROW(client_->delete_points("thoughts", PointFilter{}), InvalidArgumentError);
}

TEST_F(QdrantClientTest, CountIsExact) {
    std::string body;
    EXPECT_CALL(*mock_http_client_, send_request(
        StrEq("POST"), StrEq("/collections/thoughts/points/count"), _, _, _, _))
        .WillOnce(DoAll(SaveArg<2>(&body),
                        SetArgReferee<3>(std::string(R"({"result":{"count":12}})")),
                        Return(200u)));

    EXPECT_EQ(client_->count("thoughts", PointFilter::field_equals("session_id", "s")), 12u);
    EXPECT_TRUE(json::parse(body).at("exact").as_bool());
}

TEST(QdrantClientConfigTest, ApiKeyHeaderSet) {
    auto http = std::make_shared<MockHttpClient>();
    ServiceConfig config;
    config.host = "qdrant";
    config.port = 6333;
    config.api_key = "secret";

    QdrantClient client(http, config);
    EXPECT_EQ(http->headers().at("api-key"), "secret");
}
