#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <librdkafka/rdkafkacpp.h>

namespace verirag {

class KafkaProducer {
public:
    explicit KafkaProducer(const std::string& brokers);

    // Sends the message keyed by `key`, blocking until delivery succeeds or fails.
    void send(const std::string& topic, const std::string& key, const std::string& message);

private:
    RdKafka::Topic& topic(const std::string& name);

    std::unique_ptr<RdKafka::Producer> producer_;
    std::mutex topics_mutex_;
    std::map<std::string, std::unique_ptr<RdKafka::Topic>> topics_;
};

}  // namespace verirag
