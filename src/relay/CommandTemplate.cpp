// Repository: MacReplay-gateway
// Component: Relay Command Builder
// Purpose: Structured argument lists for the remux relay and the liveness probe.
// Copyright (c) 2025 MacReplay

#include "macreplay/relay/CommandTemplate.h"

#include <sstream>

namespace macreplay::relay {

namespace {

constexpr const char* kUrlPlaceholder = "<url>";
constexpr const char* kProxyPlaceholder = "<proxy>";
constexpr const char* kTimeoutPlaceholder = "<timeout>";

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

}  // namespace

std::string TimeoutArgument(int timeout_seconds) {
  return std::to_string(static_cast<long long>(timeout_seconds) * 1000000LL);
}

std::vector<std::string> TokenizeTemplate(const std::string& command_template) {
  std::istringstream stream(command_template);
  std::vector<std::string> tokens;
  std::string token;
  while (stream >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

std::optional<std::vector<std::string>> BuildRelayCommand(const std::string& executable,
                                                          const std::string& command_template,
                                                          const CommandContext& context) {
  const std::vector<std::string> tokens = TokenizeTemplate(command_template);

  bool has_url = false;
  for (const auto& token : tokens) {
    if (token.find(kUrlPlaceholder) != std::string::npos) {
      has_url = true;
      break;
    }
  }
  if (!has_url) return std::nullopt;

  const std::string timeout = TimeoutArgument(context.timeout_seconds);
  std::vector<std::string> argv;
  argv.reserve(tokens.size() + 1);
  argv.push_back(executable);

  for (size_t i = 0; i < tokens.size(); ++i) {
    if (context.proxy.empty() && tokens[i] == "-http_proxy" && i + 1 < tokens.size() &&
        tokens[i + 1] == kProxyPlaceholder) {
      ++i;
      continue;
    }
    std::string arg = tokens[i];
    ReplaceAll(arg, kUrlPlaceholder, context.url);
    ReplaceAll(arg, kProxyPlaceholder, context.proxy);
    ReplaceAll(arg, kTimeoutPlaceholder, timeout);
    argv.push_back(std::move(arg));
  }
  return argv;
}

std::vector<std::string> BuildWebRelayCommand(const std::string& executable,
                                              const CommandContext& context) {
  std::vector<std::string> argv = {executable};
  if (!context.proxy.empty()) {
    argv.insert(argv.end(), {"-http_proxy", context.proxy});
  }
  argv.insert(argv.end(), {"-loglevel", "panic", "-hide_banner", "-i", context.url, "-vcodec",
                           "copy", "-f", "mp4", "-movflags", "frag_keyframe+empty_moov",
                           "pipe:"});
  return argv;
}

std::vector<std::string> BuildProbeCommand(const std::string& executable,
                                           const CommandContext& context) {
  std::vector<std::string> argv = {executable};
  if (!context.proxy.empty()) {
    argv.insert(argv.end(), {"-http_proxy", context.proxy});
  }
  argv.insert(argv.end(),
              {"-timeout", TimeoutArgument(context.timeout_seconds), "-i", context.url});
  return argv;
}

std::string JoinCommand(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) out.push_back(' ');
    out += arg;
  }
  return out;
}

}  // namespace macreplay::relay
