#include "storage/minio_client.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/GetObjectRequest.h>

#include "core/errors.hpp"

namespace verirag {
namespace {

// The SDK must be initialised once per process and outlive every client.
class AwsRuntime {
public:
    AwsRuntime() { Aws::InitAPI(options_); }
    ~AwsRuntime() { Aws::ShutdownAPI(options_); }

    AwsRuntime(const AwsRuntime&) = delete;
    AwsRuntime& operator=(const AwsRuntime&) = delete;

private:
    Aws::SDKOptions options_;
};

AwsRuntime& aws_runtime() {
    static AwsRuntime runtime;
    return runtime;
}

Aws::Client::ClientConfiguration make_client_config(const std::string& endpoint) {
    Aws::Client::ClientConfiguration config;
    config.scheme = endpoint.rfind("https://", 0) == 0 ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
    config.endpointOverride = endpoint.c_str();
    config.verifySSL = config.scheme == Aws::Http::Scheme::HTTPS;
    config.region = "us-east-1";
    config.useDualStack = false;
    return config;
}

}  // namespace

struct MinioClient::Impl {
    Impl(const std::string& endpoint, const std::string& access_key, const std::string& secret_key)
        : credentials(access_key.c_str(), secret_key.c_str()),
          client(credentials,
                 make_client_config(endpoint),
                 Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
                 false) {}

    Aws::Auth::AWSCredentials credentials;
    Aws::S3::S3Client client;
};

MinioClient::MinioClient(const std::string& endpoint,
                         std::string bucket,
                         const std::string& access_key,
                         const std::string& secret_key)
    : bucket_(std::move(bucket)) {
    if (endpoint.empty() || bucket_.empty()) {
        throw std::invalid_argument("minio endpoint and bucket must not be empty");
    }
    if (access_key.empty() || secret_key.empty()) {
        throw std::invalid_argument("MINIO_ROOT_USER and MINIO_ROOT_PASSWORD must be set");
    }
    (void)aws_runtime();
    impl_ = std::make_unique<Impl>(endpoint, access_key, secret_key);
}

MinioClient::~MinioClient() = default;

std::string MinioClient::fetch_text(const std::string& object_key) {
    if (object_key.empty()) {
        throw InvalidRequest("object_key must not be empty");
    }

    Aws::S3::Model::GetObjectRequest request;
    request.SetBucket(bucket_.c_str());
    request.SetKey(object_key.c_str());

    auto outcome = impl_->client.GetObject(request);
    if (!outcome.IsSuccess()) {
        const auto& error = outcome.GetError();
        const std::string message = "minio get_object " + bucket_ + "/" + object_key + " failed: " +
                                    std::string{error.GetMessage().c_str()};
        if (error.GetErrorType() == Aws::S3::S3Errors::NO_SUCH_KEY) {
            throw InvalidRequest(message);
        }
        throw StorageUnavailable(message);
    }

    auto result = outcome.GetResultWithOwnership();
    std::ostringstream oss;
    oss << result.GetBody().rdbuf();
    return oss.str();
}

}  // namespace verirag
