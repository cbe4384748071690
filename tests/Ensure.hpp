/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_TEST_ENSURE_HPP
#define KCORE_TEST_ENSURE_HPP

#include <cstdio>
#include <string>

/**
 * @brief Removes a file created by a test when going out of scope.
 */
struct EnsureFileRemoved {

    std::string m_filename;

    EnsureFileRemoved(std::string filename)
    : m_filename(std::move(filename)) {}

    ~EnsureFileRemoved() {
        std::remove(m_filename.c_str());
    }
};

#endif
