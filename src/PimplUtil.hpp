/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_PIMPL_UTIL_HPP
#define KCORE_PIMPL_UTIL_HPP

#define PIMPL_DEFINE_COMMON_FUNCTIONS_NO_CTOR(T) \
    T::T(const T&) = default;                    \
    T::T(T&&) = default;                         \
    T& T::operator=(const T&) = default;         \
    T& T::operator=(T&&) = default;              \
    T::operator bool() const {                   \
        return static_cast<bool>(self);          \
    }                                            \
    T::~T() = default

#define PIMPL_DEFINE_COMMON_FUNCTIONS(T)         \
    T::T() = default;                            \
    T::T(const std::shared_ptr<T ## Impl>& impl) \
    : self(impl) {}                              \
    PIMPL_DEFINE_COMMON_FUNCTIONS_NO_CTOR(T)

#endif
