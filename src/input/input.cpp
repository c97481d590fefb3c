#include "untrustended/input/input.hpp"

#include "core/logger.hpp"
#include "untrustended/utils/hex.hpp"

#include <algorithm>
#include <string>

namespace untrustended::input {
namespace {

class input_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "untrustended.input"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::end_of_input:
        return "end of input";
      default:
        return "unknown untrustended.input error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static input_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

bool Reader::peek(byte b) const noexcept {
  return pos_ < in_.size() && in_[pos_] == b;
}

std::error_code Reader::read_byte(byte& out) noexcept {
  if (pos_ >= in_.size()) {
    return make_error_code(errc::end_of_input);
  }
  out = in_[pos_++];
  return {};
}

std::error_code Reader::read_bytes(std::size_t n, Input& out) noexcept {
  if (remaining() < n) {
    return make_error_code(errc::end_of_input);
  }
  out = Input(in_.subspan(pos_, n));
  pos_ += n;
  return {};
}

Input Reader::read_bytes_to_end() noexcept {
  Input rest(in_.subspan(pos_));
  pos_ = in_.size();
  return rest;
}

std::error_code Reader::skip(std::size_t n) noexcept {
  if (remaining() < n) {
    return make_error_code(errc::end_of_input);
  }
  pos_ += n;
  return {};
}

void Reader::skip_to_end() noexcept { pos_ = in_.size(); }

namespace detail {

void log_incomplete(std::size_t consumed, bytes_view rest) noexcept {
  const auto& log = core::detail::logger();
  if (!log->should_log(spdlog::level::debug)) {
    return;
  }
  utils::HexDumpOptions options;
  options.max_bytes = core::kMaxLoggedBytes;
  log->debug("read_all: {} byte(s) left unread after offset {}\n{}",
             rest.size(), consumed, utils::hex_dump(rest, options));
}

}  // namespace detail

}  // namespace untrustended::input
