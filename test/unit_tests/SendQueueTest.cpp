#include "SendQueue.hpp"

#include "TestHeaders.hpp"

using namespace ssp;

TEST_CASE("SendQueue basic operations", "[SendQueue]") {
  SendQueue queue;

  SECTION("Empty queue state") {
    REQUIRE(queue.hasPendingData() == false);
    REQUIRE(queue.size() == 0);
    REQUIRE(queue.count() == 0);
    REQUIRE(queue.peek() == nullptr);
  }

  SECTION("Packets leave in arrival order") {
    REQUIRE(queue.enqueue(7, "first"));
    REQUIRE(queue.enqueue(8, "second"));
    REQUIRE(queue.size() == 11);
    REQUIRE(queue.count() == 2);

    REQUIRE(queue.peek()->sequence == 7);
    REQUIRE(queue.peek()->data == "first");
    queue.pop();
    REQUIRE(queue.peek()->sequence == 8);
    queue.pop();
    REQUIRE(queue.hasPendingData() == false);
    REQUIRE(queue.size() == 0);
  }

  SECTION("Pop on empty queue is a no-op") {
    queue.pop();
    REQUIRE(queue.size() == 0);
  }

  SECTION("Clear") {
    queue.enqueue(1, "abc");
    queue.clear();
    REQUIRE(queue.hasPendingData() == false);
    REQUIRE(queue.size() == 0);
  }
}

TEST_CASE("SendQueue limits", "[SendQueue]") {
  SendQueue queue;
  string chunk(64 * 1024, 'x');

  for (int i = 0; i < 4; i++) {
    REQUIRE(queue.enqueue(i, chunk));
  }
  REQUIRE(queue.size() == SendQueue::MAX_QUEUE_BYTES);
  REQUIRE_FALSE(queue.canAccept(1));
  REQUIRE_FALSE(queue.enqueue(4, "y"));
  REQUIRE(queue.count() == 4);

  queue.pop();
  REQUIRE(queue.canAccept(chunk.size()));
}
