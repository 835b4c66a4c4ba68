#pragma once

#include <memory>
#include <string>

namespace courserag {

// Fetches course documents uploaded to MinIO for the ingest topic.
class MinioClient {
public:
    // Credentials come from MINIO_ROOT_USER and MINIO_ROOT_PASSWORD.
    explicit MinioClient(const std::string& endpoint);
    ~MinioClient();

    // Throws ServiceUnavailable on network failure, std::runtime_error when
    // the object cannot be read.
    std::string fetch_text(const std::string& bucket, const std::string& object_key);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace courserag
