#include "storage/minio_client.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/GetObjectRequest.h>

#include "util/errors.hpp"

namespace courserag {
namespace {

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

std::string env_or_throw(const char* name) {
    if (const char* value = std::getenv(name); value && *value) {
        return value;
    }
    throw ConfigError(std::string{"missing environment variable: "} + name);
}

Aws::Client::ClientConfiguration make_client_config(const std::string& endpoint) {
    Aws::Client::ClientConfiguration config;
    const bool tls = endpoint.rfind("https://", 0) == 0;
    config.scheme = tls ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
    config.endpointOverride = endpoint.c_str();
    config.verifySSL = tls;
    config.region = "us-east-1";
    config.useDualStack = false;
    return config;
}

}  // namespace

struct MinioClient::Impl {
    explicit Impl(const std::string& endpoint)
        : credentials(env_or_throw("MINIO_ROOT_USER"), env_or_throw("MINIO_ROOT_PASSWORD")),
          client(credentials,
                 make_client_config(endpoint),
                 Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
                 false) {}

    Aws::Auth::AWSCredentials credentials;
    Aws::S3::S3Client client;
};

MinioClient::MinioClient(const std::string& endpoint) {
    if (endpoint.empty()) {
        throw ConfigError("MINIO_ENDPOINT must not be empty");
    }
    (void)aws_runtime();
    impl_ = std::make_unique<Impl>(endpoint);
}

MinioClient::~MinioClient() = default;

std::string MinioClient::fetch_text(const std::string& bucket, const std::string& object_key) {
    Aws::S3::Model::GetObjectRequest request;
    request.SetBucket(bucket.c_str());
    request.SetKey(object_key.c_str());

    auto outcome = impl_->client.GetObject(request);
    if (!outcome.IsSuccess()) {
        const auto& error = outcome.GetError();
        const std::string message = "minio get_object failed for " + bucket + "/" + object_key + ": " +
                                    std::string{error.GetMessage().c_str()};
        if (error.ShouldRetry()) {
            throw ServiceUnavailable(message);
        }
        throw std::runtime_error(message);
    }

    auto result = outcome.GetResultWithOwnership();
    std::ostringstream oss;
    oss << result.GetBody().rdbuf();
    return oss.str();
}

}  // namespace courserag
