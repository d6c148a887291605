#ifndef SRVFRONT_ADMISSION_HPP_
#define SRVFRONT_ADMISSION_HPP_

#include <cstddef>
#include <cstdint>

namespace srvfront {

enum class AdmissionVerdict : uint8_t {
  kAccept,
  kRejectGlobal,      // registry above max_cons
  kRejectPerAddress,  // too many live connections from one host
};

// ============================================================================
// AdmissionController (pure decision logic, no side effects)
// ============================================================================
//
// The two checks are asymmetric:
//   global:      accept while registry_size <= max_cons
//   per address: reject once address_count > max_cons_per_ip
// Both counts are taken after the new connection has been recorded.

class AdmissionController {
 public:
  static constexpr size_t kDefaultMaxCons = 512;
  static constexpr size_t kDefaultMaxConsPerIp = 0;

  AdmissionController() = default;
  AdmissionController(size_t max_cons, size_t max_cons_per_ip)
      : max_cons_(max_cons), max_cons_per_ip_(max_cons_per_ip) {}

  // 0 == unlimited
  bool should_accept_more(size_t registry_size) const {
    if (max_cons_ == 0) {
      return true;
    }
    return registry_size <= max_cons_;
  }

  // 0 == unlimited
  bool per_address_exceeded(size_t address_count) const {
    return max_cons_per_ip_ > 0 && address_count > max_cons_per_ip_;
  }

  AdmissionVerdict decide(size_t registry_size, size_t address_count) const {
    if (!should_accept_more(registry_size)) {
      return AdmissionVerdict::kRejectGlobal;
    }
    if (per_address_exceeded(address_count)) {
      return AdmissionVerdict::kRejectPerAddress;
    }
    return AdmissionVerdict::kAccept;
  }

  size_t max_cons() const { return max_cons_; }
  size_t max_cons_per_ip() const { return max_cons_per_ip_; }

  void set_max_cons(size_t max) { max_cons_ = max; }
  void set_max_cons_per_ip(size_t max) { max_cons_per_ip_ = max; }

 private:
  size_t max_cons_ = kDefaultMaxCons;
  size_t max_cons_per_ip_ = kDefaultMaxConsPerIp;
};

}  // namespace srvfront

#endif  // SRVFRONT_ADMISSION_HPP_
