/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "kcore/Exception.hpp"

namespace kcore {

ClientError ClientError::ClientClosing() {
    return ClientError{"client closing"};
}

ClientError ClientError::CorrelationIDMismatch() {
    return ClientError{"correlation ID mismatch"};
}

ClientError ClientError::RecordTooLarge() {
    return ClientError{"record is too large given client max limits"};
}

ClientError ClientError::BrokerTooOld() {
    return ClientError{"broker is too old; this client does not support the broker"};
}

ClientError ClientError::NotEnoughData() {
    return ClientError{"response did not contain enough data to be valid", true};
}

ClientError ClientError::InvalidResponse() {
    return ClientError{"invalid response", true};
}

ClientError ClientError::NoBrokers() {
    return ClientError{"all connections to all brokers have died", true};
}

ClientError ClientError::NoResponse() {
    return ClientError{"message was not replied to in a produce response", true};
}

ClientError ClientError::BrokerDead() {
    return ClientError{"broker has been closed", true};
}

ClientError ClientError::BrokerConnectionDied() {
    return ClientError{"broker connection has died", true};
}

ClientError ClientError::NoPartitionIDs() {
    return ClientError{"topic currently has no known partition IDs", true};
}

ClientError ClientError::UnknownPartition() {
    return ClientError{"unknown partition", true};
}

ClientError ClientError::UnknownBrokerForLeader() {
    return ClientError{"no broker is known for partition leader id", true};
}

ClientError ClientError::UnknownController() {
    return ClientError{"controller is unknown", true};
}

ClientError ClientError::Retriable(const std::string& what) {
    return ClientError{what, true};
}

bool isRetriable(const std::exception& ex) {
    auto client_error = dynamic_cast<const ClientError*>(&ex);
    return client_error && client_error->retriable();
}

}
