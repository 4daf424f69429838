/**
 * @file security.cpp
 * @brief Wiping, constant-time helpers and the OS entropy source
 *
 * Everything ML-KEM touches that must not leak through timing lives here:
 * the decapsulation re-encryption check, the implicit-rejection key select
 * and the wiping of expanded secrets. Key generation and encapsulation pull
 * their 32-byte seeds from random_bytes().
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "pqkem/core/security.h"
#include "pqkem/core/common.h"
#include <cstdint>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#include <bcrypt.h>
#include <intrin.h>
#else
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/syscall.h>
#endif
#if defined(__APPLE__)
#include <Security/SecRandom.h>
#endif
#endif

#if defined(__GNUC__) || defined(__clang__)
#define PQKEM_MEMORY_FENCE() __asm__ __volatile__("" ::: "memory")
#elif defined(_MSC_VER)
#define PQKEM_MEMORY_FENCE() _ReadWriteBarrier()
#else
#define PQKEM_MEMORY_FENCE() ((void)0)
#endif

namespace pqkem {
namespace internal {

namespace {

// Called through a volatile pointer so the stores survive dead-store elimination
void zero_bytes(void* ptr, size_t len) {
    volatile uint8_t* out = static_cast<volatile uint8_t*>(ptr);
    for (size_t i = 0; i < len; ++i) {
        out[i] = 0;
    }
}

void (*volatile g_zero_bytes)(void*, size_t) = zero_bytes;

// OR of all byte differences; zero exactly when the regions match
uint8_t accumulate_diff(const void* a, const void* b, size_t len) {
    const volatile uint8_t* x = static_cast<const volatile uint8_t*>(a);
    const volatile uint8_t* y = static_cast<const volatile uint8_t*>(b);
    uint8_t acc = 0;
    for (size_t i = 0; i < len; ++i) {
        acc = static_cast<uint8_t>(acc | (x[i] ^ y[i]));
    }
    PQKEM_MEMORY_FENCE();
    return acc;
}

// All-ones when condition != 0, all-zeros otherwise
inline uint64_t nonzero_mask(uint64_t condition) {
    return 0U - ((condition | (0U - condition)) >> 63);
}

#if !defined(_WIN32)

class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) ::close(fd_);
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

int read_urandom(uint8_t* out, size_t len) {
    int flags = O_RDONLY;
#ifdef O_CLOEXEC
    flags |= O_CLOEXEC;
#endif
    FileDescriptor fd(::open("/dev/urandom", flags));
    if (!fd.valid()) return PQKEM_ERROR_RANDOM_FAILED;

    size_t filled = 0;
    while (filled < len) {
        ssize_t n = ::read(fd.get(), out + filled, len - filled);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return PQKEM_ERROR_RANDOM_FAILED;
        filled += static_cast<size_t>(n);
    }
    return PQKEM_SUCCESS;
}

#endif

#if defined(__linux__) && defined(SYS_getrandom)

// Raw syscall: sys/random.h needs glibc 2.25
bool fill_getrandom(uint8_t* out, size_t len) {
    size_t filled = 0;
    while (filled < len) {
        long n = ::syscall(SYS_getrandom, out + filled, len - filled, 0U);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        filled += static_cast<size_t>(n);
    }
    return true;
}

#endif

int os_random(uint8_t* out, size_t len) {
#if defined(_WIN32)
    NTSTATUS st = BCryptGenRandom(nullptr, out, static_cast<ULONG>(len),
                                  BCRYPT_USE_SYSTEM_PREFERRED_RNG);
    return st == 0 ? PQKEM_SUCCESS : PQKEM_ERROR_RANDOM_FAILED;
#elif defined(__APPLE__)
    if (SecRandomCopyBytes(kSecRandomDefault, len, out) == errSecSuccess) {
        return PQKEM_SUCCESS;
    }
    return read_urandom(out, len);
#else
#if defined(__linux__) && defined(SYS_getrandom)
    if (fill_getrandom(out, len)) return PQKEM_SUCCESS;
#endif
    return read_urandom(out, len);
#endif
}

} // anonymous namespace

void secure_zero(void* ptr, size_t len) {
    if (ptr == nullptr || len == 0) return;
#if defined(_WIN32)
    SecureZeroMemory(ptr, len);
#else
    g_zero_bytes(ptr, len);
#endif
    PQKEM_MEMORY_FENCE();
}

bool secure_compare(const void* a, const void* b, size_t len) {
    if (a == nullptr || b == nullptr) return false;
    return accumulate_diff(a, b, len) == 0;
}

uint8_t ct_equal_mask(const void* a, const void* b, size_t len) {
    if (a == nullptr || b == nullptr) return 0;
    uint32_t d = accumulate_diff(a, b, len);
    // d - 1 borrows into bit 8 only when d == 0
    return static_cast<uint8_t>(0U - (((d - 1U) >> 8) & 1U));
}

uint64_t ct_select(uint64_t condition, uint64_t a, uint64_t b) {
    uint64_t m = nonzero_mask(condition);
    return a ^ ((a ^ b) & m);
}

void ct_swap(uint64_t condition, uint64_t* a, uint64_t* b) {
    if (a == nullptr || b == nullptr) return;
    uint64_t delta = (*a ^ *b) & nonzero_mask(condition);
    *a ^= delta;
    *b ^= delta;
}

int random_bytes(void* buf, size_t len) {
    if (buf == nullptr) return PQKEM_ERROR_INVALID_PARAM;
    if (len == 0) return PQKEM_SUCCESS;
    int rc = os_random(static_cast<uint8_t*>(buf), len);
    if (rc != PQKEM_SUCCESS) secure_zero(buf, len);
    return rc;
}

} // namespace internal
} // namespace pqkem

extern "C" {

void pqkem_secure_zero(void* ptr, size_t len) {
    pqkem::internal::secure_zero(ptr, len);
}

int pqkem_secure_compare(const void* a, const void* b, size_t len) {
    return pqkem::internal::secure_compare(a, b, len) ? 1 : 0;
}

uint64_t pqkem_ct_select(uint64_t condition, uint64_t a, uint64_t b) {
    return pqkem::internal::ct_select(condition, a, b);
}

void pqkem_ct_swap(uint64_t condition, uint64_t* a, uint64_t* b) {
    pqkem::internal::ct_swap(condition, a, b);
}

int pqkem_random_bytes(void* buf, size_t len) {
    return pqkem::internal::random_bytes(buf, len);
}

} // extern "C"
