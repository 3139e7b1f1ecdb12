/**
 * @file history.hpp
 * @brief Host history contract and an in-memory implementation
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "guard.hpp"

namespace waypoint {

enum class PopDirection : uint8_t { Back, Forward, Unknown };

/**
 * @brief Details of a host-initiated position change
 */
struct PopInfo {
  int delta = 0;
  PopDirection direction = PopDirection::Unknown;
};

/// Called when the host position changes outside push/replace
using HistoryListener =
    std::function<void(const std::string& to, const std::string& from, PopInfo info)>;

/**
 * @brief Abstract host history backend
 *
 * Locations are full paths ("/a?b=1#c"). State is an opaque JSON value
 * stored beside each entry.
 */
class HistoryAdapter {
 public:
  virtual ~HistoryAdapter() = default;

  /**
   * @brief Full path of the current entry
   */
  virtual std::string current() const = 0;

  virtual void push(const std::string& location, const nlohmann::json& state) = 0;
  virtual void replace(const std::string& location, const nlohmann::json& state) = 0;

  /**
   * @brief Move through the stack; listeners learn about it via PopInfo
   */
  virtual void go(int delta) = 0;

  virtual Unregister listen(HistoryListener listener) = 0;
};

/**
 * @brief History kept in memory
 *
 * push() drops every entry ahead of the position. go() clamps to the stack
 * and notifies listeners synchronously with the delta actually travelled;
 * a clamped move of zero notifies nobody.
 */
class MemoryHistory : public HistoryAdapter {
 public:
  explicit MemoryHistory(std::string initial = "/");

  std::string current() const override;
  void push(const std::string& location, const nlohmann::json& state) override;
  void replace(const std::string& location, const nlohmann::json& state) override;
  void go(int delta) override;
  Unregister listen(HistoryListener listener) override;

  const nlohmann::json& state() const;
  size_t position() const noexcept { return position_; }
  size_t length() const noexcept { return entries_.size(); }

  /**
   * @brief Locations from oldest to newest
   */
  std::vector<std::string> locations() const;

 private:
  struct Entry {
    std::string location;
    nlohmann::json state;
  };

  std::vector<Entry> entries_;
  size_t position_ = 0;
  CallbackList<HistoryListener> listeners_;
};

}  // namespace waypoint
