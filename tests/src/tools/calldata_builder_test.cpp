#include <gtest/gtest.h>
#include <a402/contract/vault.hpp>
#include <a402/schema/primitives.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <sys/wait.h>

#ifndef A402_CALLDATA_PATH
#define A402_CALLDATA_PATH ""
#endif

namespace {

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string tool_path() {
  return std::string{A402_CALLDATA_PATH};
}

std::string run_tool(const std::string_view args) {
  auto command = shell_quote(tool_path()) + " " + std::string{args};
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;
  return trim_ascii_whitespace(output);
}

std::string hex(const a402::schema::bytes_t& bytes) {
  return a402::schema::to_hex_prefixed(a402::schema::make_bytes_view(bytes));
}

}  // namespace

class calldata_builder : public ::testing::Test {
 protected:
  void SetUp() override {
    auto path = tool_path();
    if (path.empty() || !std::filesystem::exists(path)) {
      GTEST_SKIP() << "a402_calldata binary not available: " << path;
    }
  }
};

TEST_F(calldata_builder, selector_and_digest) {
  EXPECT_EQ(run_tool("selector 'hasAccess(string,address)'"), "0x13bd20e2");
  EXPECT_EQ(run_tool("digest abc"),
            "0x4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
  EXPECT_EQ(run_tool("digest 0x616263 --hex"),
            "0x4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST_F(calldata_builder, contract_calls_match_the_library_encoding) {
  constexpr auto kUser = "0x461dA8e28B276586EB9dC4F010EbfF7F126A7076";
  EXPECT_EQ(run_tool(std::string{"has-access --resource-id video-001 --address "} +
                     kUser),
            hex(a402::contract::encode_has_access(
                "video-001", a402::schema::make_address(kUser))));
  EXPECT_EQ(run_tool("get-resource --resource-id video-001"),
            hex(a402::contract::encode_get_resource("video-001")));

  constexpr auto kNonce =
      "0x0101010101010101010101010101010101010101010101010101010101010101";
  EXPECT_EQ(run_tool(std::string{"pay --resource-id video-001 --nonce "} + kNonce),
            hex(a402::contract::encode_pay_for_access(
                "video-001", a402::schema::make_hash32(std::string_view{kNonce}))));
}

TEST_F(calldata_builder, nonce_is_a_fresh_hash) {
  auto first = run_tool("nonce");
  auto second = run_tool("nonce");
  EXPECT_EQ(first.size(), 66u);
  EXPECT_TRUE(a402::schema::try_make_hash32(first).has_value());
  EXPECT_NE(first, second);
}

TEST_F(calldata_builder, classify_and_to_wei) {
  EXPECT_EQ(run_tool("classify https://youtu.be/dQw4w9WgXcQ"),
            "video-platform https://www.youtube.com/embed/dQw4w9WgXcQ "
            "dQw4w9WgXcQ");
  EXPECT_EQ(run_tool("classify ipfs://cid --gateway https://gw.example"),
            "ipfs https://gw.example/ipfs/cid");
  EXPECT_EQ(run_tool("to-wei 0.001"), "1000000000000000");
  EXPECT_EQ(run_tool("to-wei 1.5 --decimals 6"), "1500000");
}

TEST_F(calldata_builder, invalid_input_fails) {
  auto [unknown_code, unknown_output] =
      run_capture(shell_quote(tool_path()) + " frobnicate 2>&1");
  EXPECT_NE(unknown_code, 0) << unknown_output;

  auto [amount_code, amount_output] =
      run_capture(shell_quote(tool_path()) + " to-wei 1e18 2>&1");
  EXPECT_NE(amount_code, 0) << amount_output;
}
