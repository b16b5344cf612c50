#include "chronoid/core/entropy.h"

#include "chronoid/core/errors.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <climits>
#include <string>
#include <utility>

namespace chronoid::core {

void OpenSslEntropySource::fill(std::span<std::uint8_t> out) {
  if (out.empty()) {
    return;
  }
  if (out.size() > static_cast<std::size_t>(INT_MAX)) {
    throw EntropyError("RAND_bytes request too large: " + std::to_string(out.size()) + " bytes");
  }
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    const unsigned long code = ERR_get_error();
    char reason[256] = {};
    ERR_error_string_n(code, reason, sizeof(reason));
    throw EntropyError("RAND_bytes failed: " + std::string(reason));
  }
}

void ScriptedEntropySource::push(std::vector<std::uint8_t> chunk) {
  std::lock_guard<std::mutex> lock(mutex_);
  chunks_.push_back(std::move(chunk));
}

void ScriptedEntropySource::push(std::initializer_list<std::uint8_t> chunk) {
  push(std::vector<std::uint8_t>(chunk));
}

std::size_t ScriptedEntropySource::remaining() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.size();
}

void ScriptedEntropySource::fill(std::span<std::uint8_t> out) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (chunks_.empty()) {
    throw EntropyError("scripted entropy exhausted");
  }
  const auto& chunk = chunks_.front();
  if (chunk.size() != out.size()) {
    throw EntropyError("scripted entropy chunk has " + std::to_string(chunk.size()) +
                       " bytes, requested " + std::to_string(out.size()));
  }
  std::copy(chunk.begin(), chunk.end(), out.begin());
  chunks_.pop_front();
}

}  // namespace chronoid::core
