#pragma once

#include <memory>
#include <string>

#include "storage/object_store.hpp"

namespace verirag {

// S3-compatible client for the MinIO bucket holding uploaded documents.
class MinioClient final : public ObjectStore {
public:
    MinioClient(const std::string& endpoint,
                std::string bucket,
                const std::string& access_key,
                const std::string& secret_key);
    ~MinioClient() override;

    std::string fetch_text(const std::string& object_key) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string bucket_;
};

}  // namespace verirag
