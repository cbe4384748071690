/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_EXCEPTION_HPP
#define KCORE_EXCEPTION_HPP

#include <kcore/ForwardDcl.hpp>

#include <exception>
#include <stdexcept>
#include <string>

namespace kcore {

class Exception : public std::logic_error {

    public:

    Exception(const Exception&) = default;

    Exception(Exception&&) = default;

    Exception& operator=(const Exception&) = default;

    Exception& operator=(Exception&&) = default;

    Exception(const char* w)
    : std::logic_error(w) {}

    Exception(const std::string& w)
    : std::logic_error(w) {}
};

/**
 * @brief A ClientError is an Exception raised by the client machinery
 * (as opposed to an error code returned by a broker). It carries whether
 * the operation that raised it may be retried.
 */
class ClientError : public Exception {

    public:

    ClientError(const std::string& w, bool retriable = false)
    : Exception(w)
    , m_retriable(retriable) {}

    /**
     * @brief Whether the failed operation can be retried.
     */
    bool retriable() const {
        return m_retriable;
    }

    static ClientError ClientClosing();
    static ClientError CorrelationIDMismatch();
    static ClientError RecordTooLarge();
    static ClientError BrokerTooOld();

    static ClientError NotEnoughData();
    static ClientError InvalidResponse();
    static ClientError NoBrokers();
    static ClientError NoResponse();
    static ClientError BrokerDead();
    static ClientError BrokerConnectionDied();
    static ClientError NoPartitionIDs();
    static ClientError UnknownPartition();
    static ClientError UnknownBrokerForLeader();
    static ClientError UnknownController();

    /**
     * @brief Wraps an arbitrary error message into a retriable ClientError.
     */
    static ClientError Retriable(const std::string& what);

    private:

    bool m_retriable;
};

/**
 * @brief Returns true if the exception is a ClientError flagged as retriable.
 */
bool isRetriable(const std::exception& ex);

}

#endif
