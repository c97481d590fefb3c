#pragma once

#include <spdlog/logger.h>

#include <memory>

namespace untrustended::core::detail {

// 库内部专用的命名 logger（"untrustended"），不暴露到 public headers。
[[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() noexcept;

} // namespace untrustended::core::detail
