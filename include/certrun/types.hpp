#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace certrun {

// Unique key of a job definition within a session.
using JobId = std::string;

// Closed set of job plugin kinds.
enum class PluginKind : std::uint8_t {
    Shell,
    Resource,
    Local,
    Manual,
    UserInteract,
    UserVerify,
    UserInteractVerify,
    Attachment
};

// Job outcome. None means the job did not run yet.
enum class Outcome : std::uint8_t {
    None,
    Pass,
    Fail,
    Skip,
    Crash,
    Undecided,
    NotImplemented,
    NotSupported
};

[[nodiscard]] const char* pluginKindToString(PluginKind kind) noexcept;
[[nodiscard]] std::optional<PluginKind> pluginKindFromString(const std::string& text) noexcept;

// Outcome::None prints as "none" but is never parsed back; it persists as null.
[[nodiscard]] const char* outcomeToString(Outcome outcome) noexcept;
[[nodiscard]] std::optional<Outcome> outcomeFromString(const std::string& text) noexcept;

} // namespace certrun
