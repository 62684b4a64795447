#include <a402/rpc/http_transport.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace a402::rpc {

namespace {

using curl_ptr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using curl_slist_ptr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

void ensure_curl_initialized() {
  static auto once = std::once_flag{};
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw transport_error{"libcurl global initialization failed"};
    }
  });
}

size_t append_body(char* data, size_t size, size_t count, void* user) {
  auto* body = static_cast<std::string*>(user);
  body->append(data, size * count);
  return size * count;
}

struct http_state final {
  http_transport_options options;
  std::atomic<uint64_t> next_id{1};
};

nlohmann::json round_trip(http_state& state,
                          const std::string_view method,
                          const nlohmann::json& params) {
  ensure_curl_initialized();

  auto request = nlohmann::json{{"jsonrpc", "2.0"},
                                {"id", state.next_id.fetch_add(1)},
                                {"method", std::string{method}},
                                {"params", params}};
  auto payload = request.dump();

  auto handle = curl_ptr{curl_easy_init(), curl_easy_cleanup};
  if (!handle) {
    throw transport_error{"failed to create libcurl handle"};
  }
  auto headers = curl_slist_ptr{
      curl_slist_append(nullptr, "Content-Type: application/json"),
      curl_slist_free_all};
  if (!headers) {
    throw transport_error{"failed to allocate request headers"};
  }

  auto body = std::string{};
  curl_easy_setopt(handle.get(), CURLOPT_URL, state.options.url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE,
                   static_cast<long>(payload.size()));
  curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS,
                   static_cast<long>(state.options.timeout.count()));
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &body);

  auto code = curl_easy_perform(handle.get());
  if (code != CURLE_OK) {
    spdlog::error("RPC {} to {} failed: {}", method, state.options.url,
                  curl_easy_strerror(code));
    throw transport_error{std::string{"RPC transport failed: "} +
                          curl_easy_strerror(code)};
  }

  auto status = long{};
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status < 200 || status >= 300) {
    spdlog::error("RPC {} returned HTTP {}", method, status);
    throw transport_error{"RPC endpoint returned HTTP " +
                          std::to_string(status)};
  }

  auto response = nlohmann::json::parse(body, nullptr, false);
  if (response.is_discarded() || !response.is_object()) {
    throw transport_error{"RPC endpoint returned an unparsable body"};
  }
  if (auto error = response.find("error");
      error != response.end() && !error->is_null()) {
    auto message = error->is_object() && error->contains("message") &&
                           (*error)["message"].is_string()
                       ? (*error)["message"].get<std::string>()
                       : error->dump();
    throw transport_error{"RPC error: " + message};
  }
  auto result = response.find("result");
  if (result == response.end()) {
    throw transport_error{"RPC response carries neither result nor error"};
  }
  return *result;
}

}  // namespace

transport_t make_http_transport(http_transport_options options) {
  auto state = std::make_shared<http_state>();
  state->options = std::move(options);
  return [state](const std::string_view method, const nlohmann::json& params) {
    return round_trip(*state, method, params);
  };
}

}  // namespace a402::rpc
