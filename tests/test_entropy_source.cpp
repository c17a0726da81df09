#include "uuid7util/id/entropy_source.h"

#include "entropy_test_support.h"

#include <catch2/catch_test_macros.hpp>

#include <array>

using namespace uuid7util;

TEST_CASE("OpenSslEntropySource fills the requested bytes", "[entropy]") {
  id::OpenSslEntropySource source;
  std::array<std::uint8_t, 32> first{};
  std::array<std::uint8_t, 32> second{};

  REQUIRE(source.fill(first).has_value());
  REQUIRE(source.fill(second).has_value());
  CHECK(first != second);
}

TEST_CASE("DeterministicEntropySource is reproducible per seed", "[entropy][determinism]") {
  id::DeterministicEntropySource a{42};
  id::DeterministicEntropySource b{42};
  id::DeterministicEntropySource c{43};

  std::array<std::uint8_t, 20> from_a{};
  std::array<std::uint8_t, 20> from_b{};
  std::array<std::uint8_t, 20> from_c{};
  REQUIRE(a.fill(from_a).has_value());
  REQUIRE(b.fill(from_b).has_value());
  REQUIRE(c.fill(from_c).has_value());

  CHECK(from_a == from_b);
  CHECK(from_a != from_c);

  // The stream advances between calls.
  std::array<std::uint8_t, 20> next_a{};
  REQUIRE(a.fill(next_a).has_value());
  CHECK(next_a != from_a);
}

TEST_CASE("make_random_uuid sets version 4 and the RFC variant", "[entropy]") {
  id::DeterministicEntropySource source{7};
  for (int i = 0; i < 64; ++i) {
    const auto uuid = id::make_random_uuid(source);
    REQUIRE(uuid.has_value());
    CHECK(uuid.value().version() == 4);
    CHECK(uuid.value().variant() == 0b10);
  }
}

TEST_CASE("make_random_uuid surfaces entropy failure", "[entropy][errors]") {
  testing::FailingEntropySource source{"entropy pool unavailable"};
  const auto uuid = id::make_random_uuid(source);

  REQUIRE_FALSE(uuid.has_value());
  CHECK(uuid.error().code == id::CodecError::kEntropySourceFailure);
  CHECK(uuid.error().outermost_stage() == id::CodecStage::kDrawingEntropy);
  CHECK(uuid.error().detail == "entropy pool unavailable");
  CHECK(source.calls() == 1);
}
