#pragma once

#include <a402/rpc/transport.hpp>

#include <chrono>
#include <string>

namespace a402::rpc {

struct http_transport_options final {
  std::string url;
  std::chrono::milliseconds timeout{std::chrono::seconds{10}};
};

/// JSON-RPC over HTTP POST using libcurl. Each round trip owns its own easy
/// handle, so the returned transport may be shared across threads.
transport_t make_http_transport(http_transport_options options);

}  // namespace a402::rpc
