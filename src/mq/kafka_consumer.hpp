#pragma once

#include <memory>
#include <string>
#include <vector>

#include <librdkafka/rdkafkacpp.h>

namespace verirag
{

    // Group consumer with manual offset commits. Offsets are committed by the
    // caller once a message has been fully handled.
    class KafkaConsumer
    {
    public:
        KafkaConsumer(const std::string &brokers,
                      const std::string &group_id,
                      const std::vector<std::string> &topics);
        ~KafkaConsumer();

        KafkaConsumer(const KafkaConsumer &) = delete;
        KafkaConsumer &operator=(const KafkaConsumer &) = delete;

        // Waits up to timeout_ms; nullptr on timeout or partition EOF.
        std::unique_ptr<RdKafka::Message> poll(int timeout_ms);
        void commit(const RdKafka::Message &message);

        static std::string payload(const RdKafka::Message &message);

    private:
        std::unique_ptr<RdKafka::KafkaConsumer> consumer_;
        std::unique_ptr<RdKafka::RebalanceCb> rebalance_cb_;
    };

} // namespace verirag
