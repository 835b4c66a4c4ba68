#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <librdkafka/rdkafkacpp.h>

namespace courserag {

class KafkaProducer {
public:
    explicit KafkaProducer(const std::string& brokers);
    ~KafkaProducer();

    // Sends payload keyed by key, blocking until delivery succeeds or fails.
    void send(const std::string& topic, const std::string& key, const std::string& payload);

private:
    RdKafka::Topic* topic_for(const std::string& topic_name);

    std::unique_ptr<RdKafka::Producer> producer_;
    std::mutex mutex_;
    std::map<std::string, std::unique_ptr<RdKafka::Topic>> topics_;
};

}  // namespace courserag
