#include "test_support.hpp"

#include "engine/config.hpp"
#include "engine/serializer.hpp"
#include "engine/version.hpp"

#include <gtest/gtest.h>

using namespace rp::engine;
using rp::engine::testing::run;

TEST(ReplicaName, ParsesTags) {
  auto full = ReplicaName::from_replica_tag("shop#checkout#x1y2");
  ASSERT_TRUE(full);
  EXPECT_EQ(full->app_name, "shop");
  EXPECT_EQ(full->deployment_name, "checkout");
  EXPECT_EQ(full->replica_suffix, "x1y2");
  EXPECT_EQ(full->component_name(), "shop_checkout");

  auto bare = ReplicaName::from_replica_tag("checkout#x1y2");
  ASSERT_TRUE(bare);
  EXPECT_TRUE(bare->app_name.empty());
  EXPECT_EQ(bare->component_name(), "checkout");

  EXPECT_FALSE(ReplicaName::from_replica_tag("checkout"));
  EXPECT_FALSE(ReplicaName::from_replica_tag("a#b#c#d"));
  EXPECT_FALSE(ReplicaName::from_replica_tag("app##x"));
}

TEST(DeploymentConfig, ParsesSecondsAndNestedConfigs) {
  auto config = DeploymentConfig::from_json(Json::parse(R"({
    "num_replicas": 3,
    "user_config": {"threshold": 0.5},
    "graceful_shutdown_wait_loop_s": 1.5,
    "autoscaling_config": {"min_replicas": 1, "max_replicas": 5,
                           "metrics_interval_s": 2, "look_back_period_s": 10},
    "logging_config": {"log_level": "debug", "encoding": "JSON",
                       "enable_access_log": false}
  })"));
  ASSERT_TRUE(config) << config.error().message;
  EXPECT_EQ(config->num_replicas, 3);
  EXPECT_EQ(config->max_concurrent_queries, 100);
  EXPECT_EQ(config->user_config, (Json{{"threshold", 0.5}}));
  EXPECT_EQ(config->graceful_shutdown_wait_loop, std::chrono::milliseconds(1500));
  EXPECT_EQ(config->graceful_shutdown_timeout, std::chrono::seconds(20));
  ASSERT_TRUE(config->autoscaling_config);
  EXPECT_EQ(config->autoscaling_config->max_replicas, 5);
  EXPECT_EQ(config->autoscaling_config->metrics_interval, std::chrono::seconds(2));
  EXPECT_EQ(config->logging_config.encoding, "JSON");
  EXPECT_FALSE(config->logging_config.enable_access_log);

  auto reparsed = DeploymentConfig::from_json(config->to_json());
  ASSERT_TRUE(reparsed);
  EXPECT_EQ(*reparsed, *config);
}

TEST(DeploymentConfig, RejectsInvalidInput) {
  EXPECT_FALSE(DeploymentConfig::from_json(Json::array()));
  auto unknown = DeploymentConfig::from_json(Json{{"replicas", 2}});
  ASSERT_FALSE(unknown);
  EXPECT_EQ(unknown.error().code, ErrorCode::ConfigError);
  EXPECT_FALSE(DeploymentConfig::from_json(Json{{"graceful_shutdown_timeout_s", -1}}));
  EXPECT_FALSE(DeploymentConfig::from_json(Json{{"num_replicas", "two"}}));
  EXPECT_FALSE(DeploymentConfig::from_json(
      Json{{"autoscaling_config", {{"min_replicas", 4}, {"max_replicas", 2}}}}));
  EXPECT_FALSE(DeploymentConfig::from_json(
      Json{{"logging_config", {{"encoding", "XML"}}}}));
}

TEST(DeploymentVersion, DerivedVersionKeepsCodeVersion) {
  DeploymentConfig config;
  DeploymentVersion v1("abc", config);

  auto same = DeploymentVersion::from_deployment_version(v1, config);
  EXPECT_EQ(same, v1);
  EXPECT_EQ(std::hash<DeploymentVersion>{}(same), std::hash<DeploymentVersion>{}(v1));

  auto scaled = config;
  scaled.num_replicas = 4;
  auto v2 = DeploymentVersion::from_deployment_version(v1, scaled);
  EXPECT_EQ(v2.code_version(), "abc");
  EXPECT_NE(v2.hash(), v1.hash());
  EXPECT_FALSE(v2.requires_actor_reconfigure(v1));
  EXPECT_FALSE(v2.requires_actor_restart(v1));

  auto tuned = config;
  tuned.user_config = Json{{"k", 1}};
  auto v3 = DeploymentVersion::from_deployment_version(v1, tuned);
  EXPECT_TRUE(v3.requires_actor_reconfigure(v1));

  DeploymentVersion other_code("def", config);
  EXPECT_TRUE(other_code.requires_actor_restart(v1));
  EXPECT_EQ(std::format("{}", v1), v1.to_string());
  EXPECT_EQ(v1.to_string().rfind("abc:", 0), 0u);
}

TEST(Fingerprint, StableAndSensitive) {
  EXPECT_EQ(fingerprint("replica"), fingerprint("replica"));
  EXPECT_NE(fingerprint("replica"), fingerprint("replicb"));
}

TEST(Serializer, ResolvesByName) {
  auto msgpack = make_serializer("msgpack");
  ASSERT_TRUE(msgpack);
  EXPECT_EQ((*msgpack)->content_type(), "application/msgpack");
  auto json = make_serializer("json");
  ASSERT_TRUE(json);
  const Json value = {{"ids", {1, 2, 3}}, {"name", "x"}};
  EXPECT_EQ(*(*json)->deserialize(*(*json)->serialize(value)), value);
  EXPECT_EQ(*(*msgpack)->deserialize(*(*msgpack)->serialize(value)), value);

  auto unknown = make_serializer("pickle");
  ASSERT_FALSE(unknown);
  EXPECT_EQ(unknown.error().code, ErrorCode::Serialization);
  auto broken = (*json)->deserialize("{not json");
  ASSERT_FALSE(broken);
  EXPECT_EQ(broken.error().code, ErrorCode::Serialization);
}

TEST(MessageBatchCodec, PreservesMessages) {
  const std::vector<http::Message> messages = {
      http::Message::response_start(404, {{"content-type", "text/plain"}}),
      http::Message::response_body(std::string("a\0b", 3), true),
      http::Message::response_body("", false),
  };
  auto decoded = http::MessageBatchCodec::decode(http::MessageBatchCodec::encode(messages));
  ASSERT_TRUE(decoded) << decoded.error().message;
  EXPECT_EQ(*decoded, messages);

  auto garbage = http::MessageBatchCodec::decode("\x93\x01");
  ASSERT_FALSE(garbage);
  EXPECT_EQ(garbage.error().code, ErrorCode::Serialization);
}

TEST(HttpRequest, ReadsScopeAndBody) {
  http::Scope scope;
  scope.method = "POST";
  scope.path = "/predict";
  scope.query_string = "model=small&debug";
  scope.headers = {{"Content-Type", "application/json"}};
  http::Request request(scope, rp::engine::testing::fixed_body(
                                   {http::Message::request_body(R"({"x":)", true),
                                    http::Message::request_body("1}", false)}));

  EXPECT_EQ(request.header("content-type"), "application/json");
  EXPECT_EQ(request.query_param("model"), "small");
  EXPECT_EQ(request.query_param("debug"), "");
  EXPECT_FALSE(request.query_param("missing"));

  auto body = run(request.json());
  ASSERT_TRUE(body);
  EXPECT_EQ(*body, (Json{{"x", 1}}));
  EXPECT_EQ(run(request.body()), R"({"x":1})");

  auto restored = http::Scope::from_json(scope.to_json());
  ASSERT_TRUE(restored);
  EXPECT_EQ(restored->path, "/predict");
  EXPECT_EQ(restored->headers, scope.headers);
}

TEST(HttpResponse, EncodesResultByType) {
  auto sink = std::make_shared<rp::engine::testing::SentMessages>();
  auto send = rp::engine::testing::recording_send(sink);
  run(http::send_result(Json("hi"), send));
  run(http::send_result(Json::binary({1, 2}), send));
  run(http::send_result(Json{{"a", 1}}, send));

  auto sent = sink->snapshot();
  ASSERT_EQ(sent.size(), 6u);
  EXPECT_EQ(sent[0].headers[0].second, "text/plain; charset=utf-8");
  EXPECT_EQ(sent[1].body, "hi");
  EXPECT_EQ(sent[2].headers[0].second, "application/octet-stream");
  EXPECT_EQ(sent[3].body, std::string("\x01\x02", 2));
  EXPECT_EQ(sent[4].headers[0].second, "application/json");
  EXPECT_EQ(sent[5].body, R"({"a":1})");
}
