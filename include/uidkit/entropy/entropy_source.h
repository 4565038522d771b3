#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <utility>

namespace uidkit::entropy {

// Abstract source of cryptographically secure random bytes.
// Production code reads the operating system's generator; tests substitute
// deterministic or failing sources.
class IEntropySource {
 public:
  virtual ~IEntropySource() = default;

  // Fill every byte of out. Returns false if the source could not supply
  // all bytes; out is unspecified in that case.
  [[nodiscard]] virtual bool fill(std::span<std::uint8_t> out) = 0;

 protected:
  IEntropySource() = default;
  IEntropySource(const IEntropySource&) = default;
  IEntropySource& operator=(const IEntropySource&) = default;
  IEntropySource(IEntropySource&&) = default;
  IEntropySource& operator=(IEntropySource&&) = default;
};

// SystemEntropySource draws from std::random_device, which on Linux is backed
// by the kernel CSPRNG (getrandom / /dev/urandom) or the CPU's hardware generator.
// The device is opened on the first fill(). A device that cannot be opened or
// read is reported as unavailable entropy; construction never throws.
//
// Thread-safe. Not copyable or movable (owns the device and its mutex).
class SystemEntropySource final : public IEntropySource {
 public:
  SystemEntropySource() = default;
  // token selects the device as for std::random_device(token), e.g. "/dev/urandom".
  explicit SystemEntropySource(std::string token) : token_(std::move(token)) {}
  ~SystemEntropySource() override = default;

  SystemEntropySource(const SystemEntropySource&) = delete;
  SystemEntropySource& operator=(const SystemEntropySource&) = delete;
  SystemEntropySource(SystemEntropySource&&) = delete;
  SystemEntropySource& operator=(SystemEntropySource&&) = delete;

  [[nodiscard]] bool fill(std::span<std::uint8_t> out) override;

 private:
  std::mutex mutex_;
  std::optional<std::string> token_;
  std::unique_ptr<std::random_device> device_;  // opened on first fill
};

}  // namespace uidkit::entropy
