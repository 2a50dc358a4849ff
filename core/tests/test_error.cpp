#include <boost/ut.hpp>

#include <Switchboard/Utils/Error.hpp>

using namespace boost::ut;
using namespace switchboard::utils::error;
using namespace switchboard::utils::types;

namespace {
  auto fail_helper() -> Result<i32> {
    ERR(SwbErrorCode::InvalidArgument, "fail");
  }

  auto succeed_helper() -> Result<i32> {
    return 42;
  }

  auto try_test_helper_fail() -> Result<i32> {
    i32 val = TRY(fail_helper());

    return val + 1; // Should not reach here
  }

  auto try_test_helper_success() -> Result<i32> {
    i32 val = TRY(succeed_helper());

    return val + 1; // Should be 43
  }

  auto void_helper(const bool fail) -> Result<> {
    if (fail)
      ERR_FMT(SwbErrorCode::IoError, "write to '{}' failed", "prefs.json");

    return {};
  }

  auto try_void_helper(const bool fail) -> Result<i32> {
    TRY_VOID(void_helper(fail));
    return 1;
  }
} // namespace

auto main() -> int {
  "SwbError construction"_test = [] -> void {
    SwbError err(SwbErrorCode::NotFound, "Item not found");

    expect(err.code == SwbErrorCode::NotFound);
    expect(err.message == String("Item not found"));
    expect(err.location.line() > 0);
  };

  "TRY macro success"_test = [] -> void {
    Result<i32> res = try_test_helper_success();

    expect(res.has_value());
    expect(*res == 43);
  };

  "TRY macro failure"_test = [] -> void {
    Result<i32> res = try_test_helper_fail();

    expect(!res.has_value());
    expect(res.error().code == SwbErrorCode::InvalidArgument);
    expect(res.error().message == String("fail"));
  };

  "TRY_VOID propagates errors"_test = [] -> void {
    Result<i32> good = try_void_helper(false);
    Result<i32> bad  = try_void_helper(true);

    expect(good.has_value() && *good == 1);
    expect(!bad.has_value());
    expect(bad.error().code == SwbErrorCode::IoError);
    expect(bad.error().message == String("write to 'prefs.json' failed"));
  };

  "ERR macro"_test = [] -> void {
    auto func = []() -> Result<void> {
      ERR(SwbErrorCode::InternalError, "internal error");
    };

    Result<void> res = func();

    expect(!res.has_value());
    expect(res.error().code == SwbErrorCode::InternalError);
  };

  "ERR_FROM forwards an existing error"_test = [] -> void {
    auto func = []() -> Result<i32> {
      const SwbError original(SwbErrorCode::Timeout, "slow");
      ERR_FROM(original);
    };

    Result<i32> res = func();

    expect(!res.has_value());
    expect(res.error().code == SwbErrorCode::Timeout);
    expect(res.error().message == String("slow"));
  };

  return 0;
}
