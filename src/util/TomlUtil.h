#pragma once

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <format>
#include <initializer_list>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>

#include <toml++/toml.h>

namespace TomlUtil {

// Scene fetches parse TOML on worker threads, so the counter is shared.
inline std::atomic<int>& warningCounter() {
  static std::atomic<int> counter{0};
  return counter;
}

inline void resetWarningCount() {
  warningCounter().store(0);
}

inline int warningCount() {
  return warningCounter().load();
}

inline void warnLine(std::string_view prefix, std::string_view message) {
  static constexpr std::string_view kWarningPrefix = ": warning: ";
  std::string line;
  line.reserve(prefix.size() + kWarningPrefix.size() + message.size() + 1);
  line.append(prefix);
  line.append(kWarningPrefix);
  line.append(message);
  line.push_back('\n');
  (void)std::fwrite(line.data(), 1, line.size(), stderr);
}

template <typename... Args>
inline void warnf(const char* path, std::format_string<Args...> fmt, Args&&... args) {
  ++warningCounter();
  const std::string message = std::format(fmt, std::forward<Args>(args)...);
  const std::string_view prefix =
      (path != nullptr) ? std::string_view{path} : std::string_view{"<toml>"};
  warnLine(prefix, message);
}

inline bool allowedKey(std::string_view key, std::initializer_list<std::string_view> allowed) {
  return std::ranges::any_of(allowed, [key](std::string_view a) { return key == a; });
}

inline void warnUnknownKeys(const toml::table& tbl,
                            const char* path,
                            std::string_view scope,
                            std::initializer_list<std::string_view> allowed) {
  for (const auto& [key, node] : tbl) {
    (void)node;
    std::string_view k = key.str();
    if (allowedKey(k, allowed)) {
      continue;
    }
    warnf(path, "unknown key '{}' in {}", k, scope);
  }
}

// First node present under any of the alias keys, in the order given.
inline const toml::node* findAny(const toml::table& tbl,
                                 std::initializer_list<std::string_view> aliases) {
  for (std::string_view key : aliases) {
    if (const toml::node* n = tbl.get(key))
      return n;
  }
  return nullptr;
}

// Numeric read that accepts both integers and floats under any alias.
inline std::optional<float> numberAny(const toml::table& tbl,
                                      std::initializer_list<std::string_view> aliases) {
  const toml::node* n = findAny(tbl, aliases);
  if (n == nullptr)
    return std::nullopt;
  if (auto v = n->value<double>())
    return static_cast<float>(*v);
  return std::nullopt;
}

}  // namespace TomlUtil
