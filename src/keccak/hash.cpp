#include <a402/keccak/hash.hpp>

#include <algorithm>
#include <bit>
#include <iterator>

namespace a402::keccak {

namespace {

constexpr auto kRounds = 24;

constexpr auto kRoundConstants = std::array<uint64_t, kRounds>{
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL};

constexpr auto kRotations = std::array<int, 24>{
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
    27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44};

constexpr auto kPiLanes = std::array<std::size_t, 24>{
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1};

// Keccak-f[1600]; lane (x, y) lives at index x + 5y.
void permute(std::array<uint64_t, 25>& state) {
  auto columns = std::array<uint64_t, 5>{};
  for (auto round = 0; round < kRounds; ++round) {
    // theta
    for (auto x = 0u; x < 5; ++x) {
      columns[x] = state[x] ^ state[x + 5] ^ state[x + 10] ^ state[x + 15] ^
                   state[x + 20];
    }
    for (auto x = 0u; x < 5; ++x) {
      auto d = columns[(x + 4) % 5] ^ std::rotl(columns[(x + 1) % 5], 1);
      for (auto y = 0u; y < 25; y += 5) {
        state[y + x] ^= d;
      }
    }

    // rho + pi
    auto carry = state[1];
    for (auto i = 0u; i < kPiLanes.size(); ++i) {
      auto lane = kPiLanes[i];
      auto next = state[lane];
      state[lane] = std::rotl(carry, kRotations[i]);
      carry = next;
    }

    // chi
    for (auto y = 0u; y < 25; y += 5) {
      for (auto x = 0u; x < 5; ++x) {
        columns[x] = state[y + x];
      }
      for (auto x = 0u; x < 5; ++x) {
        state[y + x] ^= (~columns[(x + 1) % 5]) & columns[(x + 2) % 5];
      }
    }

    // iota
    state[0] ^= kRoundConstants[static_cast<std::size_t>(round)];
  }
}

}  // namespace

void hasher::absorb_byte(const uint8_t value) {
  state_[position_ / 8] ^= static_cast<uint64_t>(value)
                           << (8u * (position_ % 8));
  if (++position_ == kRateBytes) {
    permute(state_);
    position_ = 0;
  }
}

void hasher::update(const a402::schema::bytes_view_t& bytes) {
  for (const auto byte : bytes) {
    absorb_byte(byte);
  }
}

void hasher::update(const std::string_view& str) {
  update(a402::schema::make_bytes_view(str));
}

void hasher::finalize(std::span<uint8_t> out) {
  state_[position_ / 8] ^= uint64_t{0x01} << (8u * (position_ % 8));
  state_[(kRateBytes - 1) / 8] ^= uint64_t{0x80}
                                  << (8u * ((kRateBytes - 1) % 8));
  permute(state_);

  auto offset = std::size_t{};
  for (auto i = std::size_t{}; i < out.size(); ++i) {
    if (offset == kRateBytes) {
      permute(state_);
      offset = 0;
    }
    out[i] = static_cast<uint8_t>(state_[offset / 8] >> (8u * (offset % 8)));
    ++offset;
  }
  reset();
}

a402::schema::hash32_t hasher::finalize() {
  auto output = a402::schema::hash32_t{};
  finalize(std::span<uint8_t>{output.data(), output.size()});
  return output;
}

void hasher::reset() {
  state_.fill(0);
  position_ = 0;
}

a402::schema::hash32_t hash(const std::string_view& str) {
  auto h = hasher{};
  h.update(str);
  return h.finalize();
}

a402::schema::hash32_t hash(const a402::schema::bytes_view_t& bytes) {
  auto h = hasher{};
  h.update(bytes);
  return h.finalize();
}

a402::schema::selector_t selector(const std::string_view& signature) {
  auto digest = hash(signature);
  auto out = a402::schema::selector_t{};
  std::copy_n(std::begin(digest), out.size(), std::begin(out));
  return out;
}

a402::schema::hash32_t event_topic(const std::string_view& signature) {
  return hash(signature);
}

}  // namespace a402::keccak
