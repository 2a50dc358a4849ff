#include <boost/ut.hpp>

#include <Switchboard/Core/Envelope.hpp>
#include <Switchboard/Core/Plugin.hpp>
#include <Switchboard/Core/PluginManager.hpp>
#include <Switchboard/Runtime/Subscription.hpp>
#include <Switchboard/Runtime/Task.hpp>
#include <Switchboard/Utils/Types.hpp>

using namespace switchboard::utils::types;
using namespace switchboard::core::plugin;
using namespace switchboard::core::runtime;

namespace {
  struct Note {
    i32 value;
  };

  struct Noted {
    i32 total;
  };

  struct TallyState {
    i32      total = 0;
    Vec<i32> seen;
  };

  // Adds every note to a running total. Negative notes schedule their positive
  // counterpart as a follow-up, and a total above 100 switches on a subscription.
  class TallyPlugin {
   public:
    using Message = Note;
    using State   = TallyState;
    using Output  = Noted;

    explicit TallyPlugin(const i32 startup = 0, const StringView name = "tally")
      : m_startup(startup), m_name(name) {}

    [[nodiscard]] auto name() const -> StringView {
      return m_name;
    }

    [[nodiscard]] auto init() const -> Pair<State, Task<Message>> {
      if (m_startup == 0)
        return { State {}, Task<Message>::none() };

      return { State {}, Task<Message>::done(Note { .value = m_startup }) };
    }

    auto update(State& state, Message message) const -> UpdateResult<Message, Output> {
      state.seen.push_back(message.value);

      if (message.value < 0)
        return UpdateResult<Message, Output>::withTask(Task<Message>::done(Note { .value = -message.value }));

      state.total += message.value;
      return UpdateResult<Message, Output>::withOutput(Noted { .total = state.total });
    }

    [[nodiscard]] auto subscription(const State& state) const -> Subscription<Message> {
      if (state.total <= 100)
        return Subscription<Message>::none();

      return Subscription<Message>::run(HashId("tally.overflow"), [](const Subscription<Message>::Sink&, const StopToken&) {});
    }

   private:
    i32        m_startup;
    StringView m_name;
  };

  struct Toggle {};

  struct SwitchState {
    bool on = false;
  };

  class SwitchPlugin {
   public:
    using Message = Toggle;
    using State   = SwitchState;
    using Output  = NoOutput;

    [[nodiscard]] auto name() const -> StringView {
      return "switch";
    }

    [[nodiscard]] auto init() const -> Pair<State, Task<Message>> {
      return { State {}, Task<Message>::none() };
    }

    auto update(State& state, Message /*message*/) const -> UpdateResult<Message, Output> {
      state.on = !state.on;
      return UpdateResult<Message, Output>::none();
    }

    [[nodiscard]] auto subscription(const State& /*state*/) const -> Subscription<Message> {
      return Subscription<Message>::none();
    }
  };

  static_assert(Plugin<TallyPlugin>);
  static_assert(Plugin<SwitchPlugin>);
} // namespace

auto main() -> int {
  using namespace boost::ut;

  "install assigns slots in order"_test = [] -> void {
    PluginManager manager;

    auto [tally, tallyStartup]   = manager.install(TallyPlugin {});
    auto [toggle, toggleStartup] = manager.install(SwitchPlugin {});

    expect(tally.index() == 0_ul);
    expect(toggle.index() == 1_ul);
    expect(manager.pluginCount() == 2_ul);
    expect(tallyStartup.isNone());
    expect(toggleStartup.isNone());

    Vec<StringView> names = manager.pluginNames();
    expect(names.size() == 2_ul);
    expect(names[0] == "tally");
    expect(names[1] == "switch");

    expect(manager.indexOf("switch") == Option<usize>(1));
    expect(!manager.indexOf("missing").has_value());
  };

  "startup work is addressed to the new slot"_test = [] -> void {
    PluginManager manager;

    [[maybe_unused]] auto first = manager.install(SwitchPlugin {});
    auto [handle, startup]      = manager.install(TallyPlugin { 7 });

    Vec<PluginMessage> messages = std::move(startup).collect();

    expect(messages.size() == 1_ul);
    expect(messages[0].pluginIndex() == handle.index());
    expect(messages[0].get<Note>()->value == 7_i);
  };

  "route applies the message and tags the output"_test = [] -> void {
    PluginManager manager;

    [[maybe_unused]] auto toggle = manager.install(SwitchPlugin {});
    auto [tally, startup]        = manager.install(TallyPlugin {});

    RouteResult result = manager.route(tally.message(Note { .value = 4 }));

    expect(result.task.isNone());
    expect(result.output.has_value());
    expect(result.output->pluginIndex() == 1_ul);
    expect(result.output->get<Noted>()->total == 4_i);
    expect((*manager.getState<TallyPlugin>())->total == 4_i);
  };

  "follow-up work stays addressed to the same slot"_test = [] -> void {
    PluginManager manager;

    auto [tally, startup] = manager.install(TallyPlugin {});

    RouteResult result = manager.route(tally.message(Note { .value = -3 }));

    expect(!result.output.has_value());

    Vec<PluginMessage> followUps = std::move(result.task).collect();
    expect(followUps.size() == 1_ul);
    expect(followUps[0].pluginIndex() == 0_ul);
    expect(followUps[0].get<Note>()->value == 3_i);

    manager.update(followUps[0]);
    expect((*manager.getState<TallyPlugin>())->total == 3_i);
  };

  "envelopes for an unknown slot are dropped"_test = [] -> void {
    PluginManager manager;

    [[maybe_unused]] auto tally = manager.install(TallyPlugin {});

    RouteResult result = manager.route(PluginMessage::make(5, Note { .value = 1 }));

    expect(result.task.isNone());
    expect(!result.output.has_value());
    expect((*manager.getState<TallyPlugin>())->seen.empty());
  };

  "envelopes of the wrong type are dropped"_test = [] -> void {
    PluginManager manager;

    auto [tally, tallyStartup] = manager.install(TallyPlugin {});
    auto [flip, flipStartup]   = manager.install(SwitchPlugin {});

    RouteResult wrong = manager.route(PluginMessage::make(tally.index(), Toggle {}));

    expect(wrong.task.isNone());
    expect(!wrong.output.has_value());
    expect((*manager.getState<TallyPlugin>())->seen.empty());

    expect(manager.update(PluginMessage::make(flip.index(), Note { .value = 1 })).isNone());
    expect(!(*manager.getState<SwitchPlugin>())->on);
  };

  "update publishes outputs to listeners of the slot"_test = [] -> void {
    PluginManager manager;

    auto [tally, startup] = manager.install(TallyPlugin {});
    auto [id, receiver]   = manager.fanout()->subscribe(tally.index());

    expect(manager.update(tally.message(Note { .value = 2 })).isNone());
    expect(manager.update(tally.message(Note { .value = 5 })).isNone());

    Option<PluginOutput> first  = receiver.tryRecv();
    Option<PluginOutput> second = receiver.tryRecv();

    expect(first.has_value() && first->get<Noted>()->total == 2);
    expect(second.has_value() && second->get<Noted>()->total == 7);
    expect(!receiver.tryRecv().has_value());
  };

  "plugins without output publish nothing"_test = [] -> void {
    PluginManager manager;

    auto [flip, startup] = manager.install(SwitchPlugin {});
    auto [id, receiver]  = manager.fanout()->subscribe(flip.index());

    expect(manager.update(flip.message(Toggle {})).isNone());

    expect((*manager.getState<SwitchPlugin>())->on);
    expect(!receiver.tryRecv().has_value());
  };

  "state lookups by type"_test = [] -> void {
    PluginManager manager;

    expect(!manager.getState<TallyPlugin>().has_value());
    expect(!manager.getHandle<TallyPlugin>().has_value());

    auto [tally, startup] = manager.install(TallyPlugin {});

    Option<TallyState*> state = manager.getStateMut<TallyPlugin>();
    expect(state.has_value());
    (*state)->total = 40;

    expect((*manager.getState<TallyPlugin>())->total == 40_i);
    expect(!manager.getState<SwitchPlugin>().has_value());

    Option<PluginHandle<TallyPlugin>> handle = manager.getHandle<TallyPlugin>();
    expect(handle.has_value());
    expect(*handle == tally);
  };

  "the first plugin of a type wins type lookups"_test = [] -> void {
    PluginManager manager;

    [[maybe_unused]] auto first  = manager.install(TallyPlugin { 0, "first" });
    [[maybe_unused]] auto second = manager.install(TallyPlugin { 0, "second" });

    manager.update(PluginMessage::make(1, Note { .value = 9 }));

    expect((*manager.getState<TallyPlugin>())->total == 0_i);
    expect(manager.getHandle<TallyPlugin>()->index() == 0_ul);
    expect((*manager.getStateByName<TallyState>("second"))->total == 9_i);
  };

  "state lookups by name check the state type"_test = [] -> void {
    PluginManager manager;

    [[maybe_unused]] auto tally = manager.install(TallyPlugin {});

    expect(manager.getStateByName<TallyState>("tally").has_value());
    expect(!manager.getStateByName<SwitchState>("tally").has_value());
    expect(!manager.getStateByName<TallyState>("nope").has_value());

    Option<TallyState*> state = manager.getStateByNameMut<TallyState>("tally");
    expect(state.has_value());
    (*state)->seen.push_back(1);

    expect((*manager.getState<TallyPlugin>())->seen.size() == 1_ul);
  };

  "subscriptions follow plugin state"_test = [] -> void {
    PluginManager manager;

    auto [tally, startup] = manager.install(TallyPlugin {});

    expect(manager.subscriptions().isNone());

    manager.update(tally.message(Note { .value = 101 }));

    expect(manager.subscriptions().size() == 1_ul);
  };

  "equal recipes from different slots get different ids"_test = [] -> void {
    PluginManager manager;

    auto [first, firstStartup]   = manager.install(TallyPlugin { 0, "first" });
    auto [second, secondStartup] = manager.install(TallyPlugin { 0, "second" });

    manager.update(first.message(Note { .value = 200 }));
    manager.update(second.message(Note { .value = 200 }));

    Subscription<PluginMessage> subscriptions = manager.subscriptions();

    expect(subscriptions.size() == 2_ul);
    expect(subscriptions.recipes()[0].id != subscriptions.recipes()[1].id);
    expect(subscriptions.recipes()[0].id == manager.subscriptions().recipes()[0].id);
  };

  "subscription messages are addressed to the owning slot"_test = [] -> void {
    struct Pulse {
      using Message = Note;
      using State   = TallyState;
      using Output  = NoOutput;

      [[nodiscard]] auto name() const -> StringView {
        return "pulse";
      }

      [[nodiscard]] auto init() const -> Pair<State, Task<Message>> {
        return { State {}, Task<Message>::none() };
      }

      auto update(State& state, Message message) const -> UpdateResult<Message, Output> {
        state.total += message.value;
        return UpdateResult<Message, Output>::none();
      }

      [[nodiscard]] auto subscription(const State& /*state*/) const -> Subscription<Message> {
        return Subscription<Message>::run(HashId("pulse"), [](const Subscription<Message>::Sink& sink, const StopToken&) {
          sink(Note { .value = 1 });
        });
      }
    };

    PluginManager manager;

    [[maybe_unused]] auto toggle = manager.install(SwitchPlugin {});
    [[maybe_unused]] auto pulse  = manager.install(Pulse {});

    Vec<PluginMessage> emitted;

    for (const auto& recipe : manager.subscriptions().recipes())
      recipe.body([&emitted](PluginMessage message) { emitted.push_back(std::move(message)); }, StopToken {});

    expect(emitted.size() == 1_ul);
    expect(emitted[0].pluginIndex() == 1_ul);

    manager.update(emitted[0]);
    expect((*manager.getStateByName<TallyState>("pulse"))->total == 1_i);
  };

  "a plugin can map one source two ways"_test = [] -> void {
    struct Twin {
      using Message = Note;
      using State   = TallyState;
      using Output  = NoOutput;

      [[nodiscard]] auto name() const -> StringView {
        return "twin";
      }

      [[nodiscard]] auto init() const -> Pair<State, Task<Message>> {
        return { State {}, Task<Message>::none() };
      }

      auto update(State& state, Message message) const -> UpdateResult<Message, Output> {
        state.total += message.value;
        return UpdateResult<Message, Output>::none();
      }

      [[nodiscard]] auto subscription(const State& /*state*/) const -> Subscription<Message> {
        const auto source = [] {
          return Subscription<i32>::run(HashId("twin.source"), [](const Subscription<i32>::Sink& sink, const StopToken&) { sink(1); });
        };

        Vec<Subscription<Message>> parts;
        parts.push_back(source().map([](const i32 value) -> Message { return Note { .value = value }; }));
        parts.push_back(source().map([](const i32 value) -> Message { return Note { .value = value * 10 }; }));
        return Subscription<Message>::batch(std::move(parts));
      }
    };

    PluginManager manager;
    [[maybe_unused]] auto twin = manager.install(Twin {});

    Subscription<PluginMessage> subscriptions = manager.subscriptions();

    expect(subscriptions.size() == 2_ul);
    expect(subscriptions.recipes()[0].id != subscriptions.recipes()[1].id);

    for (const auto& recipe : subscriptions.recipes())
      recipe.body([&manager](PluginMessage message) { manager.update(message); }, StopToken {});

    expect((*manager.getStateByName<TallyState>("twin"))->total == 11_i);
  };

  return 0;
}
