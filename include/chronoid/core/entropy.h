#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <initializer_list>
#include <mutex>
#include <span>
#include <vector>

namespace chronoid::core {

// Abstract randomness interface for dependency injection.
// Production code draws from a CSPRNG; tests replay fixed byte strings so the
// counter state machine can be driven through exact paths.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IEntropySource {
 public:
  virtual ~IEntropySource() = default;

  // Fill out with uniformly distributed bytes.
  // Contract: either every byte is written or EntropyError is thrown.
  virtual void fill(std::span<std::uint8_t> out) = 0;

 protected:
  IEntropySource() = default;
  IEntropySource(const IEntropySource&) = default;
  IEntropySource& operator=(const IEntropySource&) = default;
  IEntropySource(IEntropySource&&) = default;
  IEntropySource& operator=(IEntropySource&&) = default;
};

// Production entropy: OpenSSL RAND_bytes.
// Thread-safe (OpenSSL 1.1+ DRBG is internally locked).
class OpenSslEntropySource final : public IEntropySource {
 public:
  OpenSslEntropySource() = default;
  ~OpenSslEntropySource() override = default;

  OpenSslEntropySource(const OpenSslEntropySource&) = default;
  OpenSslEntropySource& operator=(const OpenSslEntropySource&) = default;
  OpenSslEntropySource(OpenSslEntropySource&&) = default;
  OpenSslEntropySource& operator=(OpenSslEntropySource&&) = default;

  void fill(std::span<std::uint8_t> out) override;
};

// Scripted entropy: replays queued byte strings in order.
// Each fill() consumes exactly one queued chunk, which must match the request
// size. Throws EntropyError when the queue is empty or the sizes disagree.
// For tests where reproducible output is required. Thread-safe.
class ScriptedEntropySource final : public IEntropySource {
 public:
  ScriptedEntropySource() = default;
  ~ScriptedEntropySource() override = default;

  // Not copyable or movable (contains mutex)
  ScriptedEntropySource(const ScriptedEntropySource&) = delete;
  ScriptedEntropySource& operator=(const ScriptedEntropySource&) = delete;
  ScriptedEntropySource(ScriptedEntropySource&&) = delete;
  ScriptedEntropySource& operator=(ScriptedEntropySource&&) = delete;

  void push(std::vector<std::uint8_t> chunk);
  void push(std::initializer_list<std::uint8_t> chunk);

  [[nodiscard]] std::size_t remaining() const;

  void fill(std::span<std::uint8_t> out) override;

 private:
  mutable std::mutex mutex_;
  std::deque<std::vector<std::uint8_t>> chunks_;
};

}  // namespace chronoid::core
