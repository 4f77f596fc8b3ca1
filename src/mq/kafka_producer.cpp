#include "mq/kafka_producer.hpp"

#include <stdexcept>
#include <string>

namespace verirag
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
            throw std::runtime_error("failed to set kafka bootstrap.servers: " + errstr);
        }
        if (conf->set("enable.idempotence", "true", errstr) != RdKafka::Conf::CONF_OK)
        {
            throw std::runtime_error("failed to enable kafka idempotence: " + errstr);
        }

        producer_.reset(RdKafka::Producer::create(conf.get(), errstr));
        if (!producer_)
        {
            throw std::runtime_error("failed to create kafka producer: " + errstr);
        }
    }

    RdKafka::Topic &KafkaProducer::topic(const std::string &name)
    {
        std::lock_guard<std::mutex> lock(topics_mutex_);
        auto &slot = topics_[name];
        if (!slot)
        {
            std::string errstr;
            slot.reset(RdKafka::Topic::create(producer_.get(), name, nullptr, errstr));
            if (!slot)
            {
                topics_.erase(name);
                throw std::runtime_error("failed to create kafka topic " + name + ": " + errstr);
            }
        }
        return *slot;
    }

    void KafkaProducer::send(const std::string &topic_name, const std::string &key, const std::string &message)
    {
        const auto error = producer_->produce(&topic(topic_name),
                                              RdKafka::Topic::PARTITION_UA,
                                              RdKafka::Producer::RK_MSG_COPY,
                                              const_cast<char *>(message.data()),
                                              message.size(),
                                              key.empty() ? nullptr : &key,
                                              nullptr);
        if (error != RdKafka::ERR_NO_ERROR)
        {
            throw std::runtime_error("failed to produce to " + topic_name + ": " + RdKafka::err2str(error));
        }

        const auto flush_error = producer_->flush(kFlushTimeoutMs);
        if (flush_error != RdKafka::ERR_NO_ERROR)
        {
            throw std::runtime_error("kafka flush failed: " + RdKafka::err2str(flush_error));
        }
    }

} // namespace verirag
