#include "worker/ingest_executor.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "mq/kafka_consumer.hpp"
#include "mq/kafka_producer.hpp"
#include "util/log.hpp"
#include "util/time.hpp"
#include "worker/ingest_job.hpp"

namespace verirag {
namespace {

constexpr int kPollTimeoutMs = 1000;

struct MessageContext {
    std::string topic;
    int partition = 0;
    long long offset = 0;
};

void log_completion(const MessageContext& ctx, const IngestOutcome& outcome, long long latency_ms) {
    std::ostringstream oss;
    oss << "ingest_worker document_id=" << outcome.document_id << " topic=" << ctx.topic
        << " partition=" << ctx.partition << " offset=" << ctx.offset
        << " status=" << (outcome.success ? "OK" : "ERROR") << " code=" << outcome.code
        << " latency_ms=" << latency_ms;
    if (outcome.success) {
        log::info(oss.str());
    } else {
        log::warn(oss.str());
    }
}

}  // namespace

int run_ingest_executor(const Config& config, RagService& rag, ObjectStore& store) {
    try {
        KafkaConsumer consumer(config.kafka_brokers(), config.kafka_ingest_group(),
                               std::vector<std::string>{std::string{kIngestRequestTopic}});
        KafkaProducer producer(config.kafka_brokers());
        IngestJobHandler handler(rag, store);
        log::info("ingest worker consuming " + std::string{kIngestRequestTopic} + " group=" +
                  config.kafka_ingest_group());

        while (true) {
            auto message = consumer.poll(kPollTimeoutMs);
            if (!message) {
                continue;
            }

            const auto start = std::chrono::steady_clock::now();
            MessageContext ctx;
            ctx.topic = message->topic_name();
            ctx.partition = message->partition();
            ctx.offset = message->offset();

            const auto outcome = handler.handle(KafkaConsumer::payload(*message));
            producer.send(outcome.topic, outcome.document_id, outcome.body.dump());

            // Committed only after the outcome has been published.
            consumer.commit(*message);
            log_completion(ctx, outcome, time::elapsed_ms(start));
        }
    } catch (const std::exception& ex) {
        log::error(std::string{"ingest executor failed: "} + ex.what());
        return 2;
    }
}

}  // namespace verirag
