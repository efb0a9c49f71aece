// Fatal condition that ends a sync run.
#pragma once
#include <stdexcept>
#include <string>

namespace fetchsync {

// Thrown when the run must stop, e.g. too many remote directories were empty
// or unreachable. Unwinds through TransferEngine to the script runner.
class SyncAborted : public std::runtime_error {
public:
    explicit SyncAborted(const std::string &what) : std::runtime_error(what) {}
};

} // namespace fetchsync
