#pragma once

#include <memory>
#include <string>
#include <vector>

#include <librdkafka/rdkafkacpp.h>

namespace courserag
{

    // Group consumer with manual offset commits. Offsets are committed only
    // after a request has been answered on a result or failure topic.
    class KafkaConsumer
    {
    public:
        KafkaConsumer(const std::string &brokers,
                      const std::string &group_id,
                      const std::vector<std::string> &topics);
        ~KafkaConsumer();

        KafkaConsumer(const KafkaConsumer &) = delete;
        KafkaConsumer &operator=(const KafkaConsumer &) = delete;

        // Null on timeout or partition EOF. Throws on any other consume error.
        std::unique_ptr<RdKafka::Message> poll(int timeout_ms);
        void commit(const RdKafka::Message &message);
        void close();

    private:
        std::unique_ptr<RdKafka::KafkaConsumer> consumer_;
        std::unique_ptr<RdKafka::RebalanceCb> rebalance_cb_;
        bool closed_ = false;
    };

} // namespace courserag
