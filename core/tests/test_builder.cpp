#include <boost/ut.hpp>

#include <Switchboard/Core/Envelope.hpp>
#include <Switchboard/Core/Plugin.hpp>
#include <Switchboard/Core/PluginManagerBuilder.hpp>
#include <Switchboard/Runtime/Subscription.hpp>
#include <Switchboard/Runtime/Task.hpp>
#include <Switchboard/Utils/Types.hpp>

using namespace switchboard::utils::types;
using namespace switchboard::core::plugin;
using namespace switchboard::core::runtime;

namespace {
  struct Greet {
    String text;
  };

  struct GreeterState {
    Vec<String> heard;
  };

  // Greets itself once on startup.
  class GreeterPlugin {
   public:
    using Message = Greet;
    using State   = GreeterState;
    using Output  = Greet;

    explicit GreeterPlugin(String name)
      : m_name(std::move(name)) {}

    [[nodiscard]] auto name() const -> StringView {
      return m_name;
    }

    [[nodiscard]] auto init() const -> Pair<State, Task<Message>> {
      return { State {}, Task<Message>::done(Greet { .text = "hello " + m_name }) };
    }

    auto update(State& state, Message message) const -> UpdateResult<Message, Output> {
      state.heard.push_back(message.text);
      return UpdateResult<Message, Output>::withOutput(std::move(message));
    }

    [[nodiscard]] auto subscription(const State& /*state*/) const -> Subscription<Message> {
      return Subscription<Message>::none();
    }
  };

  struct Idle {};

  class IdlePlugin {
   public:
    using Message = Idle;
    using State   = Idle;
    using Output  = NoOutput;

    [[nodiscard]] auto name() const -> StringView {
      return "idle";
    }

    [[nodiscard]] auto init() const -> Pair<State, Task<Message>> {
      return { State {}, Task<Message>::none() };
    }

    auto update(State& /*state*/, Message /*message*/) const -> UpdateResult<Message, Output> {
      return UpdateResult<Message, Output>::none();
    }

    [[nodiscard]] auto subscription(const State& /*state*/) const -> Subscription<Message> {
      return Subscription<Message>::none();
    }
  };
} // namespace

auto main() -> int {
  using namespace boost::ut;

  "handles follow the installation order"_test = [] -> void {
    PluginManagerBuilder builder;

    PluginHandle<GreeterPlugin> alice = builder.install(GreeterPlugin { "alice" });
    PluginHandle<IdlePlugin>    idle  = builder.install(IdlePlugin {});
    PluginHandle<GreeterPlugin> bob   = builder.install(GreeterPlugin { "bob" });

    expect(alice.index() == 0_ul);
    expect(idle.index() == 1_ul);
    expect(bob.index() == 2_ul);
    expect(builder.pluginCount() == 3_ul);

    auto [manager, startup] = std::move(builder).build();

    expect(manager.pluginCount() == 3_ul);
    expect(manager.indexOf("alice") == Option<usize>(alice.index()));
    expect(manager.indexOf("idle") == Option<usize>(idle.index()));
    expect(manager.indexOf("bob") == Option<usize>(bob.index()));
  };

  "build batches every startup task"_test = [] -> void {
    PluginManagerBuilder builder;

    PluginHandle<GreeterPlugin> alice = builder.install(GreeterPlugin { "alice" });
    builder.withPlugin(IdlePlugin {});
    PluginHandle<GreeterPlugin> bob = builder.install(GreeterPlugin { "bob" });

    auto [manager, startup] = std::move(builder).build();

    expect(startup.size() == 2_ul);

    Vec<PluginMessage> messages = std::move(startup).collect();
    expect(messages.size() == 2_ul);
    expect(messages[0].pluginIndex() == alice.index());
    expect(messages[0].get<Greet>()->text == "hello alice");
    expect(messages[1].pluginIndex() == bob.index());

    for (const PluginMessage& message : messages)
      expect(manager.update(message).isNone());

    expect((*manager.getStateByName<GreeterState>("alice"))->heard == Vec<String> { "hello alice" });
    expect((*manager.getStateByName<GreeterState>("bob"))->heard == Vec<String> { "hello bob" });
  };

  "handles from the builder reach the built manager's listeners"_test = [] -> void {
    PluginManagerBuilder builder;

    PluginHandle<GreeterPlugin> greeter = builder.install(GreeterPlugin { "carol" });

    auto [manager, startup] = std::move(builder).build();

    expect(manager.getHandle<GreeterPlugin>().has_value());
    expect(*manager.getHandle<GreeterPlugin>() == greeter);

    auto [id, receiver] = manager.fanout()->subscribe(greeter.index());

    manager.update(greeter.message(Greet { .text = "hi" }));

    Option<PluginOutput> output = receiver.tryRecv();
    expect(output.has_value());
    expect(output->get<Greet>()->text == "hi");
  };

  "withPlugin chains on a temporary builder"_test = [] -> void {
    auto [manager, startup] = PluginManagerBuilder {}
                                .withPlugin(GreeterPlugin { "dave" })
                                .withPlugin(IdlePlugin {})
                                .build();

    expect(manager.pluginCount() == 2_ul);
    expect(manager.pluginNames()[0] == "dave");
    expect(manager.pluginNames()[1] == "idle");
    expect(startup.size() == 1_ul);
  };

  "an empty builder gives an empty manager"_test = [] -> void {
    auto [manager, startup] = PluginManagerBuilder {}.build();

    expect(manager.pluginCount() == 0_ul);
    expect(startup.isNone());
    expect(manager.subscriptions().isNone());
  };

  return 0;
}
