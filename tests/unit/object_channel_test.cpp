#include "internal/pipeline/object_channel.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <thread>
#include <vector>

#include "internal/model/profile.hpp"
#include "internal/util/errors.hpp"

namespace {

using auklet::model::Profile;
using auklet::pipeline::ObjectChannel;

// payload {"producer": p, "seq": n}
std::unique_ptr<Profile> MakeItem(int producer, int seq) {
  google::protobuf::Value value;
  auto&                   fields = *value.mutable_struct_value()->mutable_fields();
  fields["producer"].set_number_value(producer);
  fields["seq"].set_number_value(seq);
  return std::make_unique<Profile>(std::move(value));
}

int Field(const auklet::model::Relayable& item, const char* name) {
  const auto* profile = dynamic_cast<const Profile*>(&item);
  assert(profile != nullptr);
  return static_cast<int>(profile->payload().struct_value().fields().at(name).number_value());
}

void TestReceiveReturnsItemsInSendOrder() {
  ObjectChannel channel;
  for (int i = 0; i < 5; ++i) {
    channel.Send(MakeItem(0, i));
  }
  assert(channel.Size() == 5);

  for (int i = 0; i < 5; ++i) {
    auto item = channel.Receive();
    assert(item);
    assert(Field(*item, "seq") == i);
  }
  assert(channel.Size() == 0);
}

void TestCloseDrainsQueuedItemsBeforeReportingClosure() {
  ObjectChannel channel;
  channel.Send(MakeItem(0, 1));
  channel.Send(MakeItem(0, 2));
  channel.Close();
  assert(channel.IsClosed());

  auto first  = channel.Receive();
  auto second = channel.Receive();
  assert(first && Field(*first, "seq") == 1);
  assert(second && Field(*second, "seq") == 2);
  assert(channel.Receive() == nullptr);
  assert(channel.Receive() == nullptr);
}

void TestSendAfterCloseThrows() {
  ObjectChannel channel;
  channel.Close();

  bool threw = false;
  try {
    channel.Send(MakeItem(0, 0));
  } catch (const auklet::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestNullItemIsRejected() {
  ObjectChannel channel;
  bool          threw = false;
  try {
    channel.Send(nullptr);
  } catch (const auklet::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestReceiveBlocksUntilCloseWhenEmpty() {
  ObjectChannel     channel;
  std::atomic<bool> returned{false};

  std::thread consumer([&] {
    auto item = channel.Receive();
    assert(item == nullptr);
    returned = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(!returned.load());
  channel.Close();
  consumer.join();
  assert(returned.load());
}

void TestConcurrentProducersKeepPerProducerOrder() {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 500;

  ObjectChannel            channel;
  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        channel.Send(MakeItem(p, i));
      }
    });
  }

  std::map<int, int> next_seq;
  int                received = 0;
  std::thread        consumer([&] {
    while (auto item = channel.Receive()) {
      const int producer = Field(*item, "producer");
      const int seq      = Field(*item, "seq");
      assert(seq == next_seq[producer]);
      next_seq[producer] = seq + 1;
      ++received;
    }
  });

  for (auto& t : producers) {
    t.join();
  }
  channel.Close();
  consumer.join();

  assert(received == kProducers * kPerProducer);
}

void TestBoundedCapacityBlocksProducerUntilDrained() {
  ObjectChannel channel(2);
  channel.Send(MakeItem(0, 0));
  channel.Send(MakeItem(0, 1));

  std::atomic<bool> sent{false};
  std::thread       producer([&] {
    channel.Send(MakeItem(0, 2));
    sent = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(!sent.load());
  assert(channel.Size() == 2);

  auto first = channel.Receive();
  assert(first && Field(*first, "seq") == 0);
  producer.join();
  assert(sent.load());
  assert(channel.Size() == 2);
}

void TestCloseReleasesBlockedProducer() {
  ObjectChannel channel(1);
  channel.Send(MakeItem(0, 0));

  std::atomic<bool> threw{false};
  std::thread       producer([&] {
    try {
      channel.Send(MakeItem(0, 1));
    } catch (const auklet::util::InvalidState&) {
      threw = true;
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  channel.Close();
  producer.join();
  assert(threw.load());

  auto item = channel.Receive();
  assert(item && Field(*item, "seq") == 0);
  assert(channel.Receive() == nullptr);
}

} // namespace

int main() {
  TestReceiveReturnsItemsInSendOrder();
  TestCloseDrainsQueuedItemsBeforeReportingClosure();
  TestSendAfterCloseThrows();
  TestNullItemIsRejected();
  TestReceiveBlocksUntilCloseWhenEmpty();
  TestConcurrentProducersKeepPerProducerOrder();
  TestBoundedCapacityBlocksProducerUntilDrained();
  TestCloseReleasesBlockedProducer();

  std::cout << "auklet_unit_object_channel: pass\n";
  return 0;
}
