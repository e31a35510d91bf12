#include "test_support.hpp"

#include "runtime/http_bridge.hpp"
#include "runtime/user_callable.hpp"

#include <exec/async_scope.hpp>
#include <exec/static_thread_pool.hpp>
#include <gtest/gtest.h>

using namespace rp::engine;
using namespace rp::engine::testing;

namespace {

/// Web app that streams its request body back in chunks.
class ChunkedApp : public http::App {
public:
  auto startup() -> exec::task<void> override {
    started_.store(true);
    co_return;
  }

  auto handle(http::Protocol protocol) -> exec::task<void> override {
    co_await protocol.send(http::Message::response_start(
        201, {{"content-type", "text/plain"}, {"x-app", "chunked"}}));
    while (true) {
      auto message = co_await protocol.receive();
      if (message.type != http::MessageType::RequestBody) {
        break;
      }
      co_await protocol.send(http::Message::response_body(message.body, true));
      if (!message.more_body) {
        break;
      }
    }
    co_await protocol.send(http::Message::response_body("", false));
  }

  auto started() const -> bool { return started_.load(); }

private:
  std::atomic<bool> started_{false};
};

/// Web app that answers immediately, then waits for the client to go away.
class LongPollApp : public http::App {
public:
  auto startup() -> exec::task<void> override { co_return; }

  auto handle(http::Protocol protocol) -> exec::task<void> override {
    co_await protocol.send(http::Message::response_start(200, {}));
    while (true) {
      auto message = co_await protocol.receive();
      if (message.type == http::MessageType::Disconnect) {
        break;
      }
    }
    disconnected_.store(true);
  }

  auto disconnected() const -> bool { return disconnected_.load(); }

private:
  std::atomic<bool> disconnected_{false};
};

class AppHandler : public Handler {
public:
  explicit AppHandler(std::shared_ptr<http::App> app) : app_(std::move(app)) {}

  auto capabilities() -> Capabilities override {
    Capabilities caps;
    caps.http_app = app_;
    return caps;
  }

private:
  std::shared_ptr<http::App> app_;
};

auto make_app_handler(std::shared_ptr<http::App> app, InitArgs)
    -> exec::task<std::shared_ptr<Handler>> {
  co_return std::make_shared<AppHandler>(std::move(app));
}

class PlainHandler : public Handler {
public:
  auto capabilities() -> Capabilities override {
    Capabilities caps;
    caps.methods["__call__"] =
        Method::async_unary([](CallArgs call) { return shout(std::move(call)); });
    caps.methods["fail"] = Method::unary([](const CallArgs &) -> Json {
      throw std::runtime_error("no route");
    });
    return caps;
  }

private:
  static auto shout(CallArgs call) -> exec::task<Json> {
    auto body = co_await call.request->json();
    if (!body) {
      throw std::runtime_error(body.error().message);
    }
    co_return Json{{"said", body->at("text")}, {"loud", true}};
  }
};

auto make_plain(InitArgs) -> exec::task<std::shared_ptr<Handler>> {
  co_return std::make_shared<PlainHandler>();
}

auto http_metadata(const std::string &method) -> RequestMetadata {
  RequestMetadata metadata;
  metadata.request_id = "req-http";
  metadata.route = "/app";
  metadata.call_method = method;
  metadata.is_http = true;
  metadata.is_streaming = true;
  return metadata;
}

class BridgeTest : public ::testing::Test {
protected:
  auto init(DeploymentDefinition definition) -> void {
    auto host = UserCallableHost::create(std::move(definition), InitArgs{},
                                         DeploymentId{"app", "web"});
    ASSERT_TRUE(host);
    host_ = std::move(*host);
    ASSERT_TRUE(run(host_->initialize_callable()));
    bridge_ = std::make_unique<StreamingResponseBridge>(*host_, scope_, pool_);
  }

  void TearDown() override { stdexec::sync_wait(scope_.on_empty()); }

  exec::static_thread_pool pool_{2};
  exec::async_scope scope_;
  std::unique_ptr<UserCallableHost> host_;
  std::unique_ptr<StreamingResponseBridge> bridge_;
};

} // namespace

TEST_F(BridgeTest, AppMessagesArriveInOrder) {
  auto app = std::make_shared<ChunkedApp>();
  init(ClassDefinition{"Chunked", [app](InitArgs args) {
                         return make_app_handler(app, std::move(args));
                       }});
  EXPECT_TRUE(app->started());

  auto stream = bridge_->stream(http_metadata("__call__"), http::Scope{},
                                fixed_body({http::Message::request_body("one ", true),
                                            http::Message::request_body("two ", true),
                                            http::Message::request_body("three", false)}),
                                std::make_shared<RequestContext>());
  auto items = run(collect(stream));
  ASSERT_TRUE(items) << items.error().message;
  EXPECT_FALSE(items->empty());

  const std::vector<http::Message> expected = {
      http::Message::response_start(
          201, {{"content-type", "text/plain"}, {"x-app", "chunked"}}),
      http::Message::response_body("one ", true),
      http::Message::response_body("two ", true),
      http::Message::response_body("three", true),
      http::Message::response_body("", false),
  };
  EXPECT_EQ(decode_batches(*items), expected);
  EXPECT_TRUE(stream.finished());
}

TEST_F(BridgeTest, PlainHandlerResponseIsEncoded) {
  init(ClassDefinition{"Plain", make_plain});
  auto stream = bridge_->stream(
      http_metadata("__call__"), http::Scope{},
      fixed_body({http::Message::request_body(R"({"text": "hey"})", false)}),
      std::make_shared<RequestContext>());
  auto items = run(collect(stream));
  ASSERT_TRUE(items) << items.error().message;

  auto messages = decode_batches(*items);
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0].type, http::MessageType::ResponseStart);
  EXPECT_EQ(messages[0].status, 200);
  EXPECT_EQ(Json::parse(messages[1].body), (Json{{"said", "hey"}, {"loud", true}}));
  EXPECT_FALSE(messages[1].more_body);
}

TEST_F(BridgeTest, DispatchFailureIsReportedAfterFlush) {
  init(ClassDefinition{"Plain", make_plain});
  auto stream = bridge_->stream(http_metadata("fail"), http::Scope{}, fixed_body({}),
                                std::make_shared<RequestContext>());
  std::vector<http::Message> messages;
  std::optional<ReplicaError> failure;
  while (true) {
    auto item = run(stream.next());
    if (!item) {
      failure = item.error();
      break;
    }
    if (!*item) {
      break;
    }
    auto decoded = http::MessageBatchCodec::decode(std::get<MessageBatch>(**item).bytes);
    ASSERT_TRUE(decoded);
    messages.insert(messages.end(), decoded->begin(), decoded->end());
  }
  ASSERT_TRUE(failure);
  EXPECT_EQ(failure->code, ErrorCode::UserException);
  EXPECT_EQ(failure->message, "fail failed: no route");
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0].status, 500);
}

TEST_F(BridgeTest, CancellationStopsPumpAndHandler) {
  auto app = std::make_shared<LongPollApp>();
  init(ClassDefinition{"LongPoll", [app](InitArgs args) {
                         return make_app_handler(app, std::move(args));
                       }});
  auto source = std::make_shared<BodySource>();
  auto context = std::make_shared<RequestContext>();
  auto stream = bridge_->stream(http_metadata("__call__"), http::Scope{},
                                body_receiver(source), context);
  std::optional<ReplicaError> outcome;
  stream.on_finish([&](const std::optional<ReplicaError> &error) { outcome = error; });

  auto first = run(stream.next());
  ASSERT_TRUE(first);
  ASSERT_TRUE(first->has_value());
  EXPECT_FALSE(app->disconnected());

  stream.cancel();
  EXPECT_TRUE(context->is_cancelled());
  ASSERT_TRUE(wait_for_condition([&] { return app->disconnected(); },
                                 std::chrono::seconds(5)));
  auto next = run(stream.next());
  ASSERT_FALSE(next);
  EXPECT_EQ(next.error().code, ErrorCode::Cancelled);
  ASSERT_TRUE(outcome);
  EXPECT_EQ(outcome->code, ErrorCode::Cancelled);
}

TEST_F(BridgeTest, DroppedStreamCancelsRequest) {
  auto app = std::make_shared<LongPollApp>();
  init(ClassDefinition{"LongPoll", [app](InitArgs args) {
                         return make_app_handler(app, std::move(args));
                       }});
  auto source = std::make_shared<BodySource>();
  auto context = std::make_shared<RequestContext>();
  {
    auto stream = bridge_->stream(http_metadata("__call__"), http::Scope{},
                                  body_receiver(source), context);
    ASSERT_TRUE(run(stream.next()));
  }
  EXPECT_TRUE(context->is_cancelled());
  EXPECT_TRUE(wait_for_condition([&] { return app->disconnected(); },
                                 std::chrono::seconds(5)));
}

TEST_F(BridgeTest, CancelStopsPumpWhileBodySourceIsIdle) {
  init(ClassDefinition{"Plain", make_plain});
  auto source = std::make_shared<BodySource>();
  auto stream = bridge_->stream(http_metadata("__call__"), http::Scope{},
                                body_receiver(source), std::make_shared<RequestContext>());
  stream.cancel();
  auto next = run(stream.next());
  ASSERT_FALSE(next);
  EXPECT_EQ(next.error().code, ErrorCode::Cancelled);

  // Nothing is ever pushed to the body source, yet both tasks end.
  std::atomic<bool> drained{false};
  std::thread waiter([&] {
    stdexec::sync_wait(scope_.on_empty());
    drained.store(true);
  });
  const bool stopped =
      wait_for_condition([&] { return drained.load(); }, std::chrono::seconds(5));
  if (!stopped) {
    source->push(http::Message::disconnect());
  }
  waiter.join();
  EXPECT_TRUE(stopped);

  // The pump no longer reads from the source.
  source->push(http::Message::request_body("late", false));
  EXPECT_EQ(source->queue.size(), 1u);
}
