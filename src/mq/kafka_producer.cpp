#include "mq/kafka_producer.hpp"

#include <stdexcept>

#include "util/log.hpp"

namespace courserag
{

    namespace
    {

        constexpr int kFlushTimeoutMs = 5000;

    } // namespace

    KafkaProducer::KafkaProducer(const std::string &brokers)
    {
        std::string errstr;
        std::unique_ptr<RdKafka::Conf> conf(RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));
        if (!conf)
        {
            throw std::runtime_error("failed to allocate kafka conf");
        }
        if (conf->set("bootstrap.servers", brokers, errstr) != RdKafka::Conf::CONF_OK)
        {
            throw std::runtime_error("failed to set bootstrap.servers: " + errstr);
        }
        if (conf->set("enable.idempotence", "false", errstr) != RdKafka::Conf::CONF_OK)
        {
            throw std::runtime_error("failed to set enable.idempotence: " + errstr);
        }

        producer_.reset(RdKafka::Producer::create(conf.get(), errstr));
        if (!producer_)
        {
            throw std::runtime_error("failed to create kafka producer: " + errstr);
        }
    }

    KafkaProducer::~KafkaProducer()
    {
        if (producer_ && producer_->flush(kFlushTimeoutMs) != RdKafka::ERR_NO_ERROR)
        {
            log::warn("kafka producer closed with undelivered messages");
        }
    }

    RdKafka::Topic *KafkaProducer::topic_for(const std::string &topic_name)
    {
        auto it = topics_.find(topic_name);
        if (it != topics_.end())
        {
            return it->second.get();
        }
        std::string errstr;
        std::unique_ptr<RdKafka::Topic> topic(RdKafka::Topic::create(producer_.get(), topic_name, nullptr, errstr));
        if (!topic)
        {
            throw std::runtime_error("failed to create kafka topic " + topic_name + ": " + errstr);
        }
        return topics_.emplace(topic_name, std::move(topic)).first->second.get();
    }

    void KafkaProducer::send(const std::string &topic_name, const std::string &key, const std::string &payload)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto *topic = topic_for(topic_name);
        const auto error = producer_->produce(topic,
                                              RdKafka::Topic::PARTITION_UA,
                                              RdKafka::Producer::RK_MSG_COPY,
                                              const_cast<char *>(payload.data()),
                                              payload.size(),
                                              key.empty() ? nullptr : &key,
                                              nullptr);
        if (error != RdKafka::ERR_NO_ERROR)
        {
            throw std::runtime_error("failed to produce message: " + RdKafka::err2str(error));
        }

        const auto flush_error = producer_->flush(kFlushTimeoutMs);
        if (flush_error != RdKafka::ERR_NO_ERROR)
        {
            throw std::runtime_error("kafka flush failed: " + RdKafka::err2str(flush_error));
        }
    }

} // namespace courserag
