#pragma once

#include <stdexcept>
#include <string>

namespace rowq {

// Caller-input errors: empty routing key, unknown status, bad table name, etc.
// Never retried internally.
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what) : std::invalid_argument(what) {}
};

// Connectivity or transaction failure reported by the backing store.
// Propagated unmodified; safe to retry from the outside.
class StoreUnavailable : public std::runtime_error {
public:
    explicit StoreUnavailable(const std::string& what) : std::runtime_error(what) {}
};

} // namespace rowq
