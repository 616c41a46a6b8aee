// Repository: MacReplay-gateway
// Component: Relay Command Builder
// Purpose: Structured argument lists for the remux relay and the liveness probe.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_RELAY_COMMAND_TEMPLATE_H_
#define MACREPLAY_RELAY_COMMAND_TEMPLATE_H_

#include <optional>
#include <string>
#include <vector>

namespace macreplay::relay {

struct CommandContext {
  std::string url;
  std::string proxy;  // Empty when the portal has none.
  int timeout_seconds = 5;
};

// Timeout argument passed to ffmpeg/ffprobe, in microseconds.
std::string TimeoutArgument(int timeout_seconds);

// Splits a configured template on whitespace.
std::vector<std::string> TokenizeTemplate(const std::string& command_template);

// Expands `command_template` into argv for `executable`. Placeholders <url>,
// <proxy> and <timeout> are replaced inside each argument; when there is no
// proxy the "-http_proxy <proxy>" pair is dropped. Returns nullopt for a
// template that never references <url>.
std::optional<std::vector<std::string>> BuildRelayCommand(const std::string& executable,
                                                          const std::string& command_template,
                                                          const CommandContext& context);

// Fragmented MP4 remux used for browser playback.
std::vector<std::string> BuildWebRelayCommand(const std::string& executable,
                                              const CommandContext& context);

std::vector<std::string> BuildProbeCommand(const std::string& executable,
                                           const CommandContext& context);

// Space-joined argv for log lines.
std::string JoinCommand(const std::vector<std::string>& argv);

}  // namespace macreplay::relay

#endif  // MACREPLAY_RELAY_COMMAND_TEMPLATE_H_
