#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace shspec {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kConfigError,        // Invalid glob, prefix, config file, missing support
  kRegistrationError,  // Rejected mock/stub request
  kDiscoveryError,     // Test file could not be loaded
  kHostError,          // I/O, subprocess, malformed external input
  kWarning,            // Non-fatal
};

// Distinguishes registration failures so callers can react to each one
enum class RegistrationError : uint8_t {
  kNone,
  kEmptyName,
  kEmptyBody,
  kForbiddenTarget,
  kAlreadyRegistered,
  kNotRegistered,
};

struct Diagnostic {
  DiagKind kind = DiagKind::kHostError;
  std::string message;
  std::vector<std::string> notes;
  RegistrationError registration = RegistrationError::kNone;

  auto operator==(const Diagnostic&) const -> bool = default;

  static auto ConfigError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kConfigError,
        .message = std::move(msg),
        .notes = {},
        .registration = RegistrationError::kNone,
    };
  }

  static auto Registration(RegistrationError code, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kRegistrationError,
        .message = std::move(msg),
        .notes = {},
        .registration = code,
    };
  }

  static auto DiscoveryError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kDiscoveryError,
        .message = std::move(msg),
        .notes = {},
        .registration = RegistrationError::kNone,
    };
  }

  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kHostError,
        .message = std::move(msg),
        .notes = {},
        .registration = RegistrationError::kNone,
    };
  }

  static auto Warning(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kWarning,
        .message = std::move(msg),
        .notes = {},
        .registration = RegistrationError::kNone,
    };
  }

  // Add a note (e.g. captured interpreter output)
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(std::move(msg));
    return std::move(*this);
  }

  [[nodiscard]] auto IsError() const -> bool {
    return kind != DiagKind::kWarning;
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.message.c_str();
  }

 private:
  Diagnostic diag_;
};

}  // namespace shspec
