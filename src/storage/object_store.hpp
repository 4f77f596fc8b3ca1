#pragma once

#include <string>

namespace verirag {

// Read access to uploaded document bodies. Implementations throw
// StorageUnavailable when the store cannot be reached and InvalidRequest when
// the object does not exist.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual std::string fetch_text(const std::string& object_key) = 0;
};

}  // namespace verirag
