#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include "align.hpp"

TEST_CASE("padding_for is zero on aligned addresses") {
  for (std::size_t a = 1; a <= 256; a <<= 1) {
    REQUIRE(padding_for(std::uintptr_t{0}, a) == 0);
    REQUIRE(padding_for(static_cast<std::uintptr_t>(a * 7), a) == 0);
  }
}

TEST_CASE("padding_for lands the address on the next multiple") {
  for (std::size_t a = 1; a <= 256; a <<= 1) {
    for (std::uintptr_t addr = 1000; addr < 1600; ++addr) {
      std::size_t pad = padding_for(addr, a);
      REQUIRE(pad < a);
      REQUIRE((addr + pad) % a == 0);
    }
  }
  REQUIRE(padding_for(std::uintptr_t{1}, 8) == 7);
  REQUIRE(padding_for(std::uintptr_t{9}, 8) == 7);
  REQUIRE(padding_for(std::uintptr_t{15}, 16) == 1);
}

TEST_CASE("padding_for pointer overload matches integer form") {
  alignas(64) unsigned char buf[128];
  for (int off = 0; off < 64; ++off) {
    const void* p = buf + off;
    REQUIRE(padding_for(p, 64) == padding_for(reinterpret_cast<std::uintptr_t>(p), 64));
  }
  REQUIRE(padding_for(buf + 1, 64) == 63);
}

TEST_CASE("is_pow2") {
  REQUIRE_FALSE(is_pow2(0));
  REQUIRE(is_pow2(1));
  REQUIRE(is_pow2(2));
  REQUIRE_FALSE(is_pow2(3));
  REQUIRE(is_pow2(256));
  REQUIRE_FALSE(is_pow2(257));
  static_assert(is_pow2(alignof(std::max_align_t)), "max_align_t alignment");
}
