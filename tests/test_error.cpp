#include <boost/ut.hpp>

#include <cerrno> // ENOENT, EACCES, EMFILE

#include <HostFacts/Utils/Error.hpp>

using namespace boost::ut;
using namespace hostfacts::utils::error;
using namespace hostfacts::utils::types;

namespace {
  auto fail_helper() -> Result<i32> {
    ERR(FactsErrorCode::InvalidArgument, "fail");
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

    return val + 1;
  }

  auto try_void_helper(const bool fail) -> Result<> {
    auto step = [fail]() -> Result<> {
      if (fail)
        ERR(FactsErrorCode::IoError, "step failed");

      return {};
    };

    TRY_VOID(step());

    return {};
  }
} // namespace

auto main() -> int {
  "FactsError construction"_test = [] -> void {
    FactsError err(FactsErrorCode::NotFound, "Item not found");

    expect(err.code == FactsErrorCode::NotFound);
    expect(err.message == String("Item not found"));
    expect(err.location.line() > 0);
  };

  "TRY macro success"_test = [] -> void {
    Result<i32> res = try_test_helper_success();

    expect(res.has_value());
    expect(*res == 43);
  };

  "TRY macro failure"_test = [] -> void {
#ifdef _MSC_VER
    try {
      [[maybe_unused]] Result<i32> res = try_test_helper_fail();
      expect(false); // Should have thrown
    } catch (const FactsError& e) {
      expect(e.code == FactsErrorCode::InvalidArgument);
      expect(e.message == String("fail"));
    }
#else
    Result<i32> res = try_test_helper_fail();

    expect(!res.has_value());
    expect(res.error().code == FactsErrorCode::InvalidArgument);
    expect(res.error().message == String("fail"));
#endif
  };

  "TRY_VOID propagates and continues"_test = [] -> void {
    expect(try_void_helper(false).has_value());

    Result<> failed = try_void_helper(true);

    expect(!failed.has_value());
    expect(failed.error().code == FactsErrorCode::IoError);
  };

  "ERR macro"_test = [] -> void {
    auto func = []() -> Result<> {
      ERR(FactsErrorCode::InternalError, "internal error");
    };

    Result<> res = func();

    expect(!res.has_value());
    expect(res.error().code == FactsErrorCode::InternalError);
  };

  "ERR_FMT formats the message"_test = [] -> void {
    auto func = []() -> Result<> {
      ERR_FMT(FactsErrorCode::ParseError, "bad token '{}' at {}", "x", 3);
    };

    Result<> res = func();

    expect(!res.has_value());
    expect(res.error().message == String("bad token 'x' at 3"));
  };

  "fromErrno maps common errno values"_test = [] -> void {
    expect(FactsError::fromErrno(ENOENT, "open").code == FactsErrorCode::NotFound);
    expect(FactsError::fromErrno(EACCES, "open").code == FactsErrorCode::PermissionDenied);
    expect(FactsError::fromErrno(EMFILE, "pipe").code == FactsErrorCode::ResourceExhausted);

    const FactsError err = FactsError::fromErrno(ENOENT, "open(/etc/os-release)");

    expect(err.message.starts_with("open(/etc/os-release): "));
  };

  return 0;
}
