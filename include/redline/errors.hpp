#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace redline {

enum class ErrorKind : std::uint8_t { Validation, Persistence, ResourceLimit };

std::string_view to_string(ErrorKind kind);

// Base of every error this library raises on purpose.
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &what) : std::runtime_error(what), kind_(kind) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

// Malformed identifier or text; raised before any state changes.
class ValidationError : public Error {
public:
  explicit ValidationError(const std::string &what) : Error(ErrorKind::Validation, what) {}
};

// Reading or writing persisted history failed.
class PersistenceFault : public Error {
public:
  explicit PersistenceFault(const std::string &what) : Error(ErrorKind::Persistence, what) {}
};

// Comparison input is longer than the configured cap.
class ResourceLimitExceeded : public Error {
public:
  ResourceLimitExceeded(std::size_t limit, std::size_t actual);

  [[nodiscard]] std::size_t limit() const noexcept { return limit_; }
  [[nodiscard]] std::size_t actual() const noexcept { return actual_; }

private:
  std::size_t limit_;
  std::size_t actual_;
};

} // namespace redline
