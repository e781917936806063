#pragma once
#include <algorithm>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <openssl/evp.h>

#include <condense/clock.hpp>

namespace condense::internal {

// SHA-256 wrapper using OpenSSL's EVP API. Throws std::runtime_error if
// OpenSSL fails, which the pipeline records as a failed phase.
class Sha256 {
 public:
  static constexpr size_t kDigestBytes = 32;

  static std::array<uint8_t, kDigestBytes> Digest(std::string_view data) {
    std::array<uint8_t, kDigestBytes> out{};
    unsigned int len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) &&
                    EVP_DigestUpdate(ctx, data.data(), data.size()) &&
                    EVP_DigestFinal_ex(ctx, out.data(), &len);
    EVP_MD_CTX_free(ctx);
    if (!ok || len != kDigestBytes) throw std::runtime_error("SHA-256 digest failed");
    return out;
  }
};

// Lowercase hex encoding.
inline std::string ToHex(const uint8_t* p, size_t n) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string s;
  s.reserve(n * 2);
  for (size_t i = 0; i < n; ++i) {
    s.push_back(kDigits[p[i] >> 4]);
    s.push_back(kDigits[p[i] & 0x0f]);
  }
  return s;
}

// Fingerprint used for exact-duplicate grouping.
inline std::string Fingerprint(std::string_view normalized_text) {
  auto digest = Sha256::Digest(normalized_text);
  return ToHex(digest.data(), digest.size());
}

// Run deadline. timeout_ms == 0 never expires.
class Deadline {
 public:
  Deadline(const Clock* clock, uint64_t timeout_ms)
      : clock_(clock), expires_at_us_(0) {
    if (timeout_ms == 0 || !clock) return;
    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
    const uint64_t now = clock->NowMicros();
    // Saturate; a timeout too large to represent never expires.
    if (timeout_ms > kMax / 1000 || now > kMax - timeout_ms * 1000) {
      expires_at_us_ = kMax;
    } else {
      expires_at_us_ = now + timeout_ms * 1000;
    }
  }

  bool Expired() const {
    if (expires_at_us_ == 0 || expires_at_us_ == std::numeric_limits<uint64_t>::max()) return false;
    return clock_->NowMicros() >= expires_at_us_;
  }

 private:
  const Clock* clock_;
  uint64_t expires_at_us_;
};

// Calls fn(i) for every i in [0, n). With num_threads > 1 the indices are
// handed out to std::thread workers; fn must only write state owned by i.
// The first exception thrown by fn is rethrown on the calling thread after
// all workers have joined.
template <typename Fn>
void ParallelFor(size_t n, size_t num_threads, Fn&& fn) {
  const size_t workers = std::min(num_threads, n);
  if (workers <= 1) {
    for (size_t i = 0; i < n; ++i) fn(i);
    return;
  }

  std::atomic<size_t> next{0};
  std::atomic<bool> failed{false};
  std::exception_ptr error;
  std::mutex error_mu;

  auto work = [&]() {
    while (!failed.load(std::memory_order_relaxed)) {
      const size_t i = next.fetch_add(1, std::memory_order_relaxed);
      if (i >= n) return;
      try {
        fn(i);
      } catch (...) {
        std::lock_guard<std::mutex> lock(error_mu);
        if (!error) error = std::current_exception();
        failed.store(true, std::memory_order_relaxed);
        return;
      }
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers - 1);
  for (size_t t = 1; t < workers; ++t) threads.emplace_back(work);
  work();
  for (auto& t : threads) t.join();

  if (error) std::rethrow_exception(error);
}

}  // namespace condense::internal
