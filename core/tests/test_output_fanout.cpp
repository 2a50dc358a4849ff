#include <boost/ut.hpp>
#include <chrono> // std::chrono::seconds
#include <thread> // std::jthread

#include <Switchboard/Core/Envelope.hpp>
#include <Switchboard/Core/OutputFanout.hpp>
#include <Switchboard/Utils/Types.hpp>

namespace {
  struct Reading {
    int value;
  };
} // namespace

auto main() -> int {
  using namespace boost::ut;
  using namespace switchboard::core::plugin;
  using namespace switchboard::utils::types;

  "publish without listeners delivers nothing"_test = [] -> void {
    OutputFanout fanout;

    expect(fanout.publish(PluginOutput::make(0, Reading { .value = 1 })) == 0_ul);
    expect(fanout.totalListeners() == 0_ul);
  };

  "each listener of the slot gets a copy"_test = [] -> void {
    OutputFanout fanout;

    auto first  = fanout.subscribe(0);
    auto second = fanout.subscribe(0);

    expect(first.first != second.first);
    expect(fanout.listenerCount(0) == 2_ul);

    expect(fanout.publish(PluginOutput::make(0, Reading { .value = 5 })) == 2_ul);

    Option<PluginOutput> one = first.second.tryRecv();
    Option<PluginOutput> two = second.second.tryRecv();

    expect(one.has_value() && two.has_value());
    expect(one->get<Reading>()->value == 5_i);
    expect(one->get<Reading>() == two->get<Reading>());
  };

  "outputs only reach listeners of the producing slot"_test = [] -> void {
    OutputFanout fanout;

    auto slotZero = fanout.subscribe(0);
    auto slotOne  = fanout.subscribe(1);

    expect(fanout.publish(PluginOutput::make(1, Reading { .value = 9 })) == 1_ul);

    expect(!slotZero.second.tryRecv().has_value());
    expect(slotOne.second.tryRecv().has_value());
  };

  "dropped receivers are pruned on the next publish"_test = [] -> void {
    OutputFanout fanout;

    auto kept = fanout.subscribe(0);
    { [[maybe_unused]] auto dropped = fanout.subscribe(0); }

    expect(fanout.listenerCount(0) == 2_ul);
    expect(fanout.publish(PluginOutput::make(0, Reading { .value = 1 })) == 1_ul);
    expect(fanout.listenerCount(0) == 1_ul);
    expect(kept.second.tryRecv().has_value());
  };

  "the last pruned listener removes the slot entry"_test = [] -> void {
    OutputFanout fanout;

    { [[maybe_unused]] auto dropped = fanout.subscribe(4); }

    expect(fanout.publish(PluginOutput::make(4, Reading { .value = 1 })) == 0_ul);
    expect(fanout.listenerCount(4) == 0_ul);
    expect(fanout.totalListeners() == 0_ul);
  };

  "outputs arrive in publish order"_test = [] -> void {
    OutputFanout fanout;

    auto listener = fanout.subscribe(0);

    for (int i = 0; i < 10; ++i)
      expect(fanout.publish(PluginOutput::make(0, Reading { .value = i })) == 1_ul);

    for (int i = 0; i < 10; ++i) {
      Option<PluginOutput> output = listener.second.tryRecv();
      expect(output.has_value() && output->get<Reading>()->value == i);
    }
  };

  "a listener on another thread receives published outputs"_test = [] -> void {
    OutputFanout fanout;

    auto listener = fanout.subscribe(0);
    int  received = 0;

    {
      std::jthread consumer([&received, receiver = std::move(listener.second)] mutable {
        while (Option<PluginOutput> output = receiver.recvFor(std::chrono::seconds(5)))
          if (output->get<Reading>()->value < 0)
            return;
          else
            received += output->get<Reading>()->value;
      });

      expect(fanout.publish(PluginOutput::make(0, Reading { .value = 2 })) == 1_ul);
      expect(fanout.publish(PluginOutput::make(0, Reading { .value = 3 })) == 1_ul);
      expect(fanout.publish(PluginOutput::make(0, Reading { .value = -1 })) == 1_ul);
    }

    expect(received == 5_i);
  };

  return 0;
}
