#pragma once

#include <memory>

#include <exec/async_scope.hpp>
#include <exec/static_thread_pool.hpp>

#include "engine/http.hpp"
#include "engine/sequence.hpp"
#include "engine/types.hpp"
#include "runtime/user_callable.hpp"

namespace rp::engine {

/// Serves an HTTP call through unary dispatch and hands the response
/// messages the handler pushes back to the caller as a stream of batches.
///
/// Two tasks run per call on `pool`, tracked by `scope`: a pump moving body
/// messages from the caller into the handler's receive queue, and the
/// dispatch itself. Each stream item is one MessageBatch holding every
/// message buffered since the previous pull, encoded by MessageBatchCodec.
/// The stream ends once the dispatch is done and its messages are flushed,
/// and reports the dispatch failure, if any, after that.
///
/// Cancelling or dropping the stream stops the pump, closes the handler's
/// receive queue (it then reads a disconnect) and marks the request
/// cancelled. A pending read of the body source is asked to stop through
/// its stop token; the source must honour it (AsyncQueue::pop does).
class StreamingResponseBridge {
public:
  StreamingResponseBridge(UserCallableHost &host, exec::async_scope &scope,
                          exec::static_thread_pool &pool)
      : host_(host), scope_(scope), pool_(pool) {}

  /// Start the call. `permit` is held until the dispatch task itself ends,
  /// which may be after the stream is cancelled or dropped.
  auto stream(RequestMetadata metadata, http::Scope scope,
              http::Receive body_source,
              std::shared_ptr<RequestContext> context,
              std::shared_ptr<void> permit = nullptr) -> ResultStream;

private:
  UserCallableHost &host_;
  exec::async_scope &scope_;
  exec::static_thread_pool &pool_;
};

}  // namespace rp::engine
