#pragma once
#include "cloak/cloak_common.hpp"
#include "cloak/logging.hpp"

#include <stdexcept>

namespace cloak {

// Guarded, page-locked heap memory that is zeroed before release.
class SecureBuffer {
public:
    explicit SecureBuffer(size_t size)
        : size_(size)
    {
        if (size_ == 0) {
            return;
        }
        ensure_sodium_ready();

        ptr_ = static_cast<unsigned char*>(sodium_malloc(size_));
        if (!ptr_) {
            audit_log_level(LogLevel::ERROR,
                "SecureBuffer: sodium_malloc failed",
                "secure_memory",
                "failure");
            throw std::runtime_error("SecureBuffer: sodium_malloc failed");
        }

        locked_ = sodium_mlock(ptr_, size_) == 0;
        if (!locked_) {
            audit_log_level(LogLevel::WARN,
                "SecureBuffer: sodium_mlock failed, continuing without page lock",
                "secure_memory",
                "degraded");
        }

        sodium_mprotect_readwrite(ptr_);
        sodium_memzero(ptr_, size_);
    }

    SecureBuffer() = default;

    // Non-copyable
    SecureBuffer(const SecureBuffer&) = delete;
    SecureBuffer& operator=(const SecureBuffer&) = delete;

    // Movable
    SecureBuffer(SecureBuffer&& other) noexcept
        : ptr_(other.ptr_), size_(other.size_), locked_(other.locked_)
    {
        other.ptr_ = nullptr;
        other.size_ = 0;
        other.locked_ = false;
    }

    SecureBuffer& operator=(SecureBuffer&& other) noexcept {
        if (this != &other) {
            wipe();
            ptr_ = other.ptr_;
            size_ = other.size_;
            locked_ = other.locked_;
            other.ptr_ = nullptr;
            other.size_ = 0;
            other.locked_ = false;
        }
        return *this;
    }

    ~SecureBuffer() {
        wipe();
    }

    unsigned char* data() { return ptr_; }
    const unsigned char* data() const { return ptr_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    // Zero and release; safe to call any number of times.
    void wipe() noexcept {
        if (ptr_) {
            sodium_mprotect_readwrite(ptr_);
            sodium_memzero(ptr_, size_);
            if (locked_) {
                sodium_munlock(ptr_, size_);
            }
            sodium_free(ptr_);
        }
        ptr_ = nullptr;
        size_ = 0;
        locked_ = false;
    }

private:
    unsigned char* ptr_ = nullptr;
    size_t size_ = 0;
    bool locked_ = false;
};

} // namespace cloak
