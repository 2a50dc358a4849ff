#include <boost/ut.hpp>
#include <format> // std::format

#include <Switchboard/Runtime/Task.hpp>
#include <Switchboard/Utils/Types.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace switchboard::core::runtime;
  using namespace switchboard::utils::types;

  "none has no actions"_test = [] -> void {
    Task<i32> task = Task<i32>::none();

    expect(task.isNone());
    expect(task.size() == 0_ul);
    expect(std::move(task).collect().empty());
  };

  "done yields its message once"_test = [] -> void {
    Vec<i32> messages = Task<i32>::done(7).collect();

    expect(messages.size() == 1_ul);
    expect(messages[0] == 7_i);
  };

  "perform converts the work result"_test = [] -> void {
    Task<String> task = Task<String>::perform(
      [] -> i32 { return 21; },
      [](const i32 value) -> String { return std::format("answer={}", value * 2); }
    );

    Vec<String> messages = std::move(task).collect();

    expect(messages.size() == 1_ul);
    expect(messages[0] == String("answer=42"));
  };

  "stream emits several messages"_test = [] -> void {
    Task<i32> task = Task<i32>::stream([](const Task<i32>::Sink& sink, const StopToken&) {
      for (i32 i = 1; i <= 3; ++i)
        sink(i);
    });

    Vec<i32> messages = std::move(task).collect();

    expect(messages == Vec<i32> { 1, 2, 3 });
  };

  "batch keeps every action in order"_test = [] -> void {
    Vec<Task<i32>> tasks;
    tasks.push_back(Task<i32>::done(1));
    tasks.push_back(Task<i32>::none());
    tasks.push_back(Task<i32>::done(2));

    Task<i32> merged = Task<i32>::batch(std::move(tasks));

    expect(merged.size() == 2_ul);
    expect(std::move(merged).collect() == Vec<i32> { 1, 2 });
  };

  "map transforms every message"_test = [] -> void {
    Vec<Task<i32>> tasks;
    tasks.push_back(Task<i32>::done(1));
    tasks.push_back(Task<i32>::done(2));

    Task<String> mapped = Task<i32>::batch(std::move(tasks)).map([](const i32 value) -> String { return std::to_string(value * 10); });

    expect(mapped.size() == 2_ul);
    expect(std::move(mapped).collect() == Vec<String> { "10", "20" });
  };

  "map with a stateful function"_test = [] -> void {
    Task<i32> counted = Task<i32>::stream([](const Task<i32>::Sink& sink, const StopToken&) {
                          sink(0);
                          sink(0);
                          sink(0);
                        }).map([count = 0](i32) mutable -> i32 { return ++count; });

    expect(std::move(counted).collect() == Vec<i32> { 1, 2, 3 });
  };

  "abortable runs normally until aborted"_test = [] -> void {
    auto [task, handle] = Task<i32>::done(5).abortable();

    expect(!handle.isAborted());
    expect(std::move(task).collect() == Vec<i32> { 5 });
  };

  "abort before running suppresses the action"_test = [] -> void {
    bool ran = false;

    auto [task, handle] = Task<i32>::perform([&ran] -> i32 { ran = true; return 1; }, [](const i32 value) -> i32 { return value; }).abortable();

    handle.abort();

    expect(handle.isAborted());
    expect(std::move(task).collect().empty());
    expect(!ran);
  };

  "abort while streaming drops later messages"_test = [] -> void {
    Option<AbortHandle> abortHandle;

    auto [task, handle] = Task<i32>::stream([&abortHandle](const Task<i32>::Sink& sink, const StopToken& token) {
                            sink(1);
                            abortHandle->abort();
                            expect(token.stop_requested());
                            sink(2);
                          }).abortable();

    abortHandle = handle;

    expect(std::move(task).collect() == Vec<i32> { 1 });
  };

  "actions hands over ownership"_test = [] -> void {
    Task<i32> task = Task<i32>::done(3);

    Vec<Task<i32>::Action> actions = std::move(task).actions();

    expect(actions.size() == 1_ul);

    i32 received = 0;
    actions[0]([&received](const i32 value) { received = value; }, StopToken {});

    expect(received == 3_i);
  };

  return 0;
}
