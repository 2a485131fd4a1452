#include "ReceiveWindow.hpp"

#include "TestHeaders.hpp"

using namespace ssp;

TEST_CASE("ReceiveWindow detects duplicates", "[ReceiveWindow]") {
  ReceiveWindow window;

  SECTION("In order") {
    REQUIRE(window.accept(0));
    REQUIRE(window.accept(1));
    REQUIRE_FALSE(window.accept(0));
    REQUIRE_FALSE(window.accept(1));
    REQUIRE(window.getFloor() == 2);
    REQUIRE(window.tracked() == 0);
  }

  SECTION("Out of order") {
    REQUIRE(window.accept(2));
    REQUIRE(window.accept(1));
    REQUIRE_FALSE(window.accept(2));
    REQUIRE(window.getFloor() == 0);
    REQUIRE(window.tracked() == 2);

    // Closing the gap folds everything into the floor
    REQUIRE(window.accept(0));
    REQUIRE(window.getFloor() == 3);
    REQUIRE(window.tracked() == 0);
    REQUIRE_FALSE(window.accept(1));
  }
}

TEST_CASE("ReceiveWindow stays bounded", "[ReceiveWindow]") {
  ReceiveWindow window(3);

  REQUIRE(window.accept(0));
  REQUIRE(window.accept(5));
  REQUIRE(window.accept(6));
  REQUIRE(window.accept(7));
  REQUIRE(window.tracked() == 3);

  // Overflow gives up on the gap below the oldest tracked number
  REQUIRE(window.accept(8));
  REQUIRE(window.getFloor() == 9);
  REQUIRE(window.tracked() == 0);
  REQUIRE_FALSE(window.accept(3));
  REQUIRE(window.accept(9));

  for (uint64_t seq = 20; seq < 2000; seq += 2) {
    REQUIRE(window.accept(seq));
    REQUIRE(window.tracked() <= 3);
  }
}
