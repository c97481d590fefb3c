#include "untrustended/core/error.hpp"

#include "untrustended/input/input.hpp"

#include <string>

namespace untrustended::core {
namespace {

class untrustended_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "untrustended"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::end_of_input:
        return "end of input";
      case errc::parse_error:
        return "parse error";
      case errc::invalid_value:
        return "invalid value";
      case errc::unknown_error:
        return "unknown error";
      default:
        return "unknown untrustended error";
    }
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static untrustended_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

std::error_code from_input_error(std::error_code ec) noexcept {
  if (!ec) {
    return {};
  }
  if (ec.category() == error_category()) {
    return ec;
  }
  if (ec == input::make_error_code(input::errc::end_of_input)) {
    return make_error_code(errc::end_of_input);
  }
  return make_error_code(errc::unknown_error);
}

}  // 命名空间 untrustended::core
